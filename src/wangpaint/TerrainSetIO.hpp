#pragma once

#include "wangpaint/Json.hpp"
#include "wangpaint/TerrainSet.hpp"
#include "wangpaint/TileGrid.hpp"

#include <string>

namespace wangpaint {

// JSON form of a terrain set:
//
//   {
//     "name": "ground",
//     "type": "corner" | "edge" | "mixed",
//     "default_penalty": 1.0,
//     "terrains": [ { "name": "grass", "color": [r, g, b] }, ... ],
//     "transitions": [ { "from": 0, "to": 1, "penalty": 0.5 }, ... ],
//     "tiles": [ { "id": 3, "terrain": [0, null, 1, 1], "probability": 2.0 }, ... ]
//   }
//
// "terrain" lists terrain indices in the mode's slot order (TerrainSlotLayout),
// null meaning no terrain in that slot. "probability" is optional (default 1).
//
// Unlike the config helpers, a terrain set is always parsed into a fresh set:
// outSet is only replaced when the whole document is valid.
bool ParseTerrainSetJson(const JsonValue& root, TerrainSet& outSet, std::string& outError);
bool LoadTerrainSetJsonFile(const std::string& path, TerrainSet& outSet, std::string& outError);

JsonValue TerrainSetToJsonValue(const TerrainSet& set);
std::string TerrainSetToJson(const TerrainSet& set, int indentSpaces = 2);
bool WriteTerrainSetJsonFile(const std::string& path, const TerrainSet& set, std::string& outError);

// JSON form of a tile grid: { "width": W, "height": H, "tiles": [null | id, ...] }
// with W*H row-major entries (row 0 first). A missing "tiles" array means an
// empty grid.
bool ParseTileGridJson(const JsonValue& root, TileGrid& outGrid, std::string& outError);
bool LoadTileGridJsonFile(const std::string& path, TileGrid& outGrid, std::string& outError);

JsonValue TileGridToJsonValue(const TileGrid& grid);
std::string TileGridToJson(const TileGrid& grid, int indentSpaces = 2);
bool WriteTileGridJsonFile(const std::string& path, const TileGrid& grid, std::string& outError);

} // namespace wangpaint
