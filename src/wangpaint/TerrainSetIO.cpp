#include "wangpaint/TerrainSetIO.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>

namespace wangpaint {

namespace {

static bool IsFiniteDouble(double v)
{
  return std::isfinite(v) != 0;
}

// Integral JSON number in [lo, hi].
static bool GetInt(const JsonValue& v, long long lo, long long hi, long long& out)
{
  if (!v.isNumber() || !IsFiniteDouble(v.numberValue)) return false;
  if (std::floor(v.numberValue) != v.numberValue) return false;
  if (v.numberValue < static_cast<double>(lo) || v.numberValue > static_cast<double>(hi)) return false;
  out = static_cast<long long>(v.numberValue);
  return true;
}

static bool GetFloat(const JsonValue& v, float& out)
{
  if (!v.isNumber() || !IsFiniteDouble(v.numberValue)) return false;
  const double dv = v.numberValue;
  if (std::fabs(dv) > static_cast<double>(std::numeric_limits<float>::max())) return false;
  out = static_cast<float>(dv);
  return true;
}

static std::string At(const char* what, std::size_t i)
{
  return std::string(what) + "[" + std::to_string(i) + "]";
}

static bool ParseTerrains(const JsonValue& arr, TerrainSet& set, std::string& err)
{
  if (!arr.isArray()) {
    err = "expected array for key 'terrains'";
    return false;
  }
  if (arr.arrayValue.size() >= static_cast<std::size_t>(std::numeric_limits<TerrainId>::max())) {
    err = "too many terrains (max 254)";
    return false;
  }

  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& t = arr.arrayValue[i];
    if (!t.isObject()) {
      err = At("terrains", i) + " must be an object";
      return false;
    }

    TerrainInfo info;
    if (const JsonValue* name = FindJsonMember(t, "name")) {
      if (!name->isString()) {
        err = At("terrains", i) + ".name must be a string";
        return false;
      }
      info.name = name->stringValue;
    }

    if (const JsonValue* color = FindJsonMember(t, "color")) {
      if (!color->isArray() || color->arrayValue.size() != 3) {
        err = At("terrains", i) + ".color must be [r, g, b]";
        return false;
      }
      std::uint8_t* rgb[3] = {&info.r, &info.g, &info.b};
      for (std::size_t k = 0; k < 3; ++k) {
        long long c = 0;
        if (!GetInt(color->arrayValue[k], 0, 255, c)) {
          err = At("terrains", i) + ".color components must be integers in [0,255]";
          return false;
        }
        *rgb[k] = static_cast<std::uint8_t>(c);
      }
    }

    set.addTerrain(std::move(info));
  }
  return true;
}

static bool ParseTransitions(const JsonValue& arr, TerrainSet& set, std::string& err)
{
  if (!arr.isArray()) {
    err = "expected array for key 'transitions'";
    return false;
  }

  const long long maxTerrain = static_cast<long long>(set.terrainCount()) - 1;
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& t = arr.arrayValue[i];
    if (!t.isObject()) {
      err = At("transitions", i) + " must be an object";
      return false;
    }

    const JsonValue* from = FindJsonMember(t, "from");
    const JsonValue* to = FindJsonMember(t, "to");
    const JsonValue* penalty = FindJsonMember(t, "penalty");
    if (!from || !to || !penalty) {
      err = At("transitions", i) + " needs 'from', 'to' and 'penalty'";
      return false;
    }

    long long a = 0;
    long long b = 0;
    if (!GetInt(*from, 0, maxTerrain, a) || !GetInt(*to, 0, maxTerrain, b)) {
      err = At("transitions", i) + " refers to an unknown terrain";
      return false;
    }

    float p = 0.0f;
    if (!GetFloat(*penalty, p) || p < 0.0f) {
      err = At("transitions", i) + ".penalty must be a non-negative number";
      return false;
    }

    set.setTransitionPenalty(static_cast<int>(a), static_cast<int>(b), p);
  }
  return true;
}

static bool ParseTiles(const JsonValue& arr, TerrainSet& set, std::string& err)
{
  if (!arr.isArray()) {
    err = "expected array for key 'tiles'";
    return false;
  }

  const int slotCount = TerrainSlotCount(set.type());
  const long long maxTerrain = static_cast<long long>(set.terrainCount()) - 1;
  const long long maxId = static_cast<long long>(kNoTile) - 1;
  std::set<TileId> seen;

  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& t = arr.arrayValue[i];
    if (!t.isObject()) {
      err = At("tiles", i) + " must be an object";
      return false;
    }

    const JsonValue* idv = FindJsonMember(t, "id");
    long long id = 0;
    if (!idv || !GetInt(*idv, 0, maxId, id)) {
      err = At("tiles", i) + ".id must be a non-negative integer";
      return false;
    }
    const TileId tileId = static_cast<TileId>(id);
    if (!seen.insert(tileId).second) {
      err = "duplicate tile id " + std::to_string(id);
      return false;
    }

    const JsonValue* slots = FindJsonMember(t, "terrain");
    if (!slots || !slots->isArray()) {
      err = At("tiles", i) + ".terrain must be an array";
      return false;
    }
    if (static_cast<int>(slots->arrayValue.size()) != slotCount) {
      err = At("tiles", i) + ".terrain must have " + std::to_string(slotCount) + " entries for a " +
            ToString(set.type()) + " set";
      return false;
    }

    TileTerrain terrain;
    for (int s = 0; s < slotCount; ++s) {
      const JsonValue& sv = slots->arrayValue[static_cast<std::size_t>(s)];
      if (sv.isNull()) continue;
      long long ti = 0;
      if (!GetInt(sv, 0, maxTerrain, ti)) {
        err = At("tiles", i) + ".terrain[" + std::to_string(s) + "] is not a known terrain index";
        return false;
      }
      terrain.slots[static_cast<std::size_t>(s)] = static_cast<int>(ti);
    }
    set.setTileTerrain(tileId, terrain);

    if (const JsonValue* prob = FindJsonMember(t, "probability")) {
      float p = 0.0f;
      if (!GetFloat(*prob, p) || !(p > 0.0f)) {
        err = At("tiles", i) + ".probability must be a positive number";
        return false;
      }
      set.setTileProbability(tileId, p);
    }
  }
  return true;
}

static JsonValue IntJson(long long v)
{
  return JsonValue::MakeNumber(static_cast<double>(v));
}

} // namespace

bool ParseTerrainSetJson(const JsonValue& root, TerrainSet& outSet, std::string& outError)
{
  if (!root.isObject()) {
    outError = "terrain set JSON must be an object";
    return false;
  }

  TerrainSet set;
  std::string err;

  if (const JsonValue* name = FindJsonMember(root, "name")) {
    if (!name->isString()) {
      outError = "expected string for key 'name'";
      return false;
    }
    set.setName(name->stringValue);
  }

  const JsonValue* type = FindJsonMember(root, "type");
  if (!type || !type->isString()) {
    outError = "expected string for key 'type'";
    return false;
  }
  TerrainSetType t{};
  if (!ParseTerrainSetType(type->stringValue, t)) {
    outError = "unknown type: '" + type->stringValue + "'";
    return false;
  }
  set.setType(t);

  if (const JsonValue* dp = FindJsonMember(root, "default_penalty")) {
    float p = 0.0f;
    if (!GetFloat(*dp, p) || p < 0.0f) {
      outError = "default_penalty must be a non-negative number";
      return false;
    }
    set.setDefaultPenalty(p);
  }

  // Terrains first: transitions and tiles are validated against them.
  if (const JsonValue* terrains = FindJsonMember(root, "terrains")) {
    if (!ParseTerrains(*terrains, set, err)) {
      outError = err;
      return false;
    }
  }
  if (const JsonValue* transitions = FindJsonMember(root, "transitions")) {
    if (!ParseTransitions(*transitions, set, err)) {
      outError = err;
      return false;
    }
  }
  if (const JsonValue* tiles = FindJsonMember(root, "tiles")) {
    if (!ParseTiles(*tiles, set, err)) {
      outError = err;
      return false;
    }
  }

  outSet = std::move(set);
  outError.clear();
  return true;
}

bool LoadTerrainSetJsonFile(const std::string& path, TerrainSet& outSet, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;

  std::string err;
  if (!ParseTerrainSetJson(root, outSet, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

JsonValue TerrainSetToJsonValue(const TerrainSet& set)
{
  JsonValue root = JsonValue::MakeObject();
  root.add("name", JsonValue::MakeString(set.name()));
  root.add("type", JsonValue::MakeString(ToString(set.type())));
  root.add("default_penalty", JsonValue::MakeNumber(static_cast<double>(set.defaultPenalty())));

  JsonValue terrains = JsonValue::MakeArray();
  for (const TerrainInfo& info : set.terrains()) {
    JsonValue t = JsonValue::MakeObject();
    t.add("name", JsonValue::MakeString(info.name));
    JsonValue color = JsonValue::MakeArray();
    color.push(IntJson(info.r));
    color.push(IntJson(info.g));
    color.push(IntJson(info.b));
    t.add("color", std::move(color));
    terrains.push(std::move(t));
  }
  root.add("terrains", std::move(terrains));

  JsonValue transitions = JsonValue::MakeArray();
  for (const auto& kv : set.transitionPenalties()) {
    JsonValue t = JsonValue::MakeObject();
    t.add("from", IntJson(kv.first.first));
    t.add("to", IntJson(kv.first.second));
    t.add("penalty", JsonValue::MakeNumber(static_cast<double>(kv.second)));
    transitions.push(std::move(t));
  }
  root.add("transitions", std::move(transitions));

  const int slotCount = TerrainSlotCount(set.type());
  JsonValue tiles = JsonValue::MakeArray();
  for (const auto& kv : set.tileTerrains()) {
    JsonValue t = JsonValue::MakeObject();
    t.add("id", IntJson(kv.first));

    JsonValue slots = JsonValue::MakeArray();
    for (int s = 0; s < slotCount; ++s) {
      const int ti = kv.second.get(s);
      slots.push(ti >= 0 ? IntJson(ti) : JsonValue::MakeNull());
    }
    t.add("terrain", std::move(slots));

    if (set.hasTileProbability(kv.first)) {
      t.add("probability", JsonValue::MakeNumber(static_cast<double>(set.tileProbability(kv.first))));
    }
    tiles.push(std::move(t));
  }
  root.add("tiles", std::move(tiles));

  return root;
}

std::string TerrainSetToJson(const TerrainSet& set, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.indent = std::max(0, indentSpaces);
  return JsonStringify(TerrainSetToJsonValue(set), opt);
}

bool WriteTerrainSetJsonFile(const std::string& path, const TerrainSet& set, std::string& outError)
{
  return WriteFileText(path, TerrainSetToJson(set), outError);
}

bool ParseTileGridJson(const JsonValue& root, TileGrid& outGrid, std::string& outError)
{
  if (!root.isObject()) {
    outError = "grid JSON must be an object";
    return false;
  }

  // 1<<15 per side keeps width*height well inside int.
  constexpr long long kMaxSide = 1LL << 15;

  long long w = 0;
  long long h = 0;
  const JsonValue* wv = FindJsonMember(root, "width");
  const JsonValue* hv = FindJsonMember(root, "height");
  if (!wv || !GetInt(*wv, 0, kMaxSide, w)) {
    outError = "width must be an integer in [0," + std::to_string(kMaxSide) + "]";
    return false;
  }
  if (!hv || !GetInt(*hv, 0, kMaxSide, h)) {
    outError = "height must be an integer in [0," + std::to_string(kMaxSide) + "]";
    return false;
  }

  TileGrid grid(static_cast<int>(w), static_cast<int>(h));

  if (const JsonValue* tiles = FindJsonMember(root, "tiles")) {
    if (!tiles->isArray()) {
      outError = "expected array for key 'tiles'";
      return false;
    }
    if (tiles->arrayValue.size() != grid.cellCount()) {
      outError = "tiles has " + std::to_string(tiles->arrayValue.size()) + " entries, expected " +
                 std::to_string(grid.cellCount());
      return false;
    }

    const long long maxId = static_cast<long long>(kNoTile) - 1;
    for (std::size_t i = 0; i < tiles->arrayValue.size(); ++i) {
      const JsonValue& v = tiles->arrayValue[i];
      if (v.isNull()) continue;
      long long id = 0;
      if (!GetInt(v, 0, maxId, id)) {
        outError = At("tiles", i) + " must be null or a non-negative integer";
        return false;
      }
      grid.tiles()[i] = static_cast<TileId>(id);
    }
  }

  outGrid = std::move(grid);
  outError.clear();
  return true;
}

bool LoadTileGridJsonFile(const std::string& path, TileGrid& outGrid, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;

  std::string err;
  if (!ParseTileGridJson(root, outGrid, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

JsonValue TileGridToJsonValue(const TileGrid& grid)
{
  JsonValue root = JsonValue::MakeObject();
  root.add("width", IntJson(grid.width()));
  root.add("height", IntJson(grid.height()));

  JsonValue tiles = JsonValue::MakeArray();
  tiles.arrayValue.reserve(grid.cellCount());
  for (const TileId t : grid.tiles()) {
    tiles.push(t == kNoTile ? JsonValue::MakeNull() : IntJson(t));
  }
  root.add("tiles", std::move(tiles));
  return root;
}

std::string TileGridToJson(const TileGrid& grid, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.indent = std::max(0, indentSpaces);
  return JsonStringify(TileGridToJsonValue(grid), opt);
}

bool WriteTileGridJsonFile(const std::string& path, const TileGrid& grid, std::string& outError)
{
  return WriteFileText(path, TileGridToJson(grid), outError);
}

} // namespace wangpaint
