#pragma once

#include "wangpaint/Json.hpp"

#include <string>

namespace wangpaint {

// Tool-side paint settings.
struct PaintConfig {
  // World units per tile, used to resolve world positions to paint targets.
  float tileSize = 1.0f;

  // Terrain index painted by default.
  int terrain = 0;

  // Emit filler trace lines.
  bool trace = false;
};

// JSON helpers for PaintConfig.
//
// Merge semantics: missing keys leave the existing value unchanged. Field
// names are snake_case ("tile_size", "terrain", "trace").
std::string PaintConfigToJson(const PaintConfig& cfg, int indentSpaces = 2);

bool ApplyPaintConfigJson(const JsonValue& root, PaintConfig& ioCfg, std::string& outError);
bool LoadPaintConfigJsonFile(const std::string& path, PaintConfig& ioCfg, std::string& outError);
bool WritePaintConfigJsonFile(const std::string& path, const PaintConfig& cfg, std::string& outError,
                              int indentSpaces = 2);

} // namespace wangpaint
