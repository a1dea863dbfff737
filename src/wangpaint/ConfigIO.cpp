#include "wangpaint/ConfigIO.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace wangpaint {

namespace {

static bool IsFiniteDouble(double v)
{
  return std::isfinite(v) != 0;
}

static bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

static bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue) || std::fabs(v->numberValue) > 2147483647.0) {
    err = std::string("out-of-range number for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(v->numberValue));
  return true;
}

static bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (std::fabs(dv) > static_cast<double>(std::numeric_limits<float>::max())) {
    err = std::string("out-of-range float for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(dv);
  return true;
}

static std::string FloatToJson(float v)
{
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(6);
  oss << static_cast<double>(v);
  std::string s = oss.str();
  while (s.size() > 1 && s.find('.') != std::string::npos && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  if (s.empty()) s = "0";
  return s;
}

} // namespace

std::string PaintConfigToJson(const PaintConfig& cfg, int indentSpaces)
{
  const std::string pad(static_cast<std::size_t>(std::max(0, indentSpaces)), ' ');
  std::ostringstream oss;
  oss << "{\n";
  oss << pad << "\"tile_size\": " << FloatToJson(cfg.tileSize) << ",\n";
  oss << pad << "\"terrain\": " << cfg.terrain << ",\n";
  oss << pad << "\"trace\": " << (cfg.trace ? "true" : "false") << "\n";
  oss << "}\n";
  return oss.str();
}

bool ApplyPaintConfigJson(const JsonValue& root, PaintConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "PaintConfig JSON must be an object";
    return false;
  }

  // Work on a copy so a bad key leaves ioCfg untouched.
  PaintConfig cfg = ioCfg;
  std::string err;

  if (!ApplyF32(root, "tile_size", cfg.tileSize, err)) {
    outError = err;
    return false;
  }
  if (!(cfg.tileSize > 0.0f)) {
    outError = "tile_size must be > 0";
    return false;
  }

  if (!ApplyI32(root, "terrain", cfg.terrain, err)) {
    outError = err;
    return false;
  }
  if (cfg.terrain < 0) {
    outError = "terrain must be >= 0";
    return false;
  }

  if (!ApplyBool(root, "trace", cfg.trace, err)) {
    outError = err;
    return false;
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool LoadPaintConfigJsonFile(const std::string& path, PaintConfig& ioCfg, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;

  std::string err;
  if (!ApplyPaintConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

bool WritePaintConfigJsonFile(const std::string& path, const PaintConfig& cfg, std::string& outError,
                              int indentSpaces)
{
  return WriteFileText(path, PaintConfigToJson(cfg, indentSpaces), outError);
}

} // namespace wangpaint
