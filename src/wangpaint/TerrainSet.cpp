#include "wangpaint/TerrainSet.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace wangpaint {

namespace {

static std::string LowerCopy(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// One table per mode; the slot order is what tile terrain data uses.
constexpr std::array<int, 8> kCornerLayout = {7, 1, 5, 3, -1, -1, -1, -1};
constexpr std::array<int, 8> kEdgeLayout = {0, 2, 4, 6, -1, -1, -1, -1};
constexpr std::array<int, 8> kMixedLayout = {7, 0, 1, 2, 3, 4, 5, 6};

} // namespace

const char* ToString(TerrainSetType t)
{
  switch (t) {
  case TerrainSetType::Corner: return "corner";
  case TerrainSetType::Edge: return "edge";
  case TerrainSetType::Mixed: return "mixed";
  default: return "corner";
  }
}

bool ParseTerrainSetType(const std::string& s, TerrainSetType& out)
{
  const std::string t = LowerCopy(s);
  if (t.empty()) return false;

  if (t == "corner" || t == "corners") {
    out = TerrainSetType::Corner;
    return true;
  }
  if (t == "edge" || t == "edges" || t == "side" || t == "sides") {
    out = TerrainSetType::Edge;
    return true;
  }
  if (t == "mixed" || t == "both" || t == "corner_edge" || t == "corners_and_edges") {
    out = TerrainSetType::Mixed;
    return true;
  }
  return false;
}

int TerrainSlotCount(TerrainSetType t)
{
  return (t == TerrainSetType::Mixed) ? 8 : 4;
}

const std::array<int, 8>& TerrainSlotLayout(TerrainSetType t)
{
  switch (t) {
  case TerrainSetType::Corner: return kCornerLayout;
  case TerrainSetType::Edge: return kEdgeLayout;
  case TerrainSetType::Mixed: return kMixedLayout;
  }
  return kCornerLayout;
}

bool IsActiveWangIndex(TerrainSetType t, int i)
{
  switch (t) {
  case TerrainSetType::Corner: return IsCornerWangIndex(i);
  case TerrainSetType::Edge: return !IsCornerWangIndex(i);
  case TerrainSetType::Mixed: return true;
  }
  return true;
}

TileTerrain TileTerrain::Corners(int topLeft, int topRight, int bottomLeft, int bottomRight)
{
  TileTerrain t;
  t.slots[0] = topLeft;
  t.slots[1] = topRight;
  t.slots[2] = bottomLeft;
  t.slots[3] = bottomRight;
  return t;
}

TileTerrain TileTerrain::Edges(int top, int right, int bottom, int left)
{
  TileTerrain t;
  t.slots[0] = top;
  t.slots[1] = right;
  t.slots[2] = bottom;
  t.slots[3] = left;
  return t;
}

TileTerrain TileTerrain::Mixed(int topLeft, int top, int topRight, int right, int bottomRight, int bottom,
                               int bottomLeft, int left)
{
  TileTerrain t;
  t.slots = {topLeft, top, topRight, right, bottomRight, bottom, bottomLeft, left};
  return t;
}

TileTerrain TileTerrain::Uniform(TerrainSetType type, int terrain)
{
  TileTerrain t;
  const int n = TerrainSlotCount(type);
  for (int i = 0; i < n; ++i) t.slots[static_cast<std::size_t>(i)] = terrain;
  return t;
}

TerrainSet::TerrainSet(std::string name, TerrainSetType type)
    : m_name(std::move(name))
    , m_type(type)
{}

int TerrainSet::addTerrain(TerrainInfo info)
{
  m_terrains.push_back(std::move(info));
  return static_cast<int>(m_terrains.size()) - 1;
}

void TerrainSet::setTileTerrain(TileId tile, const TileTerrain& terrain)
{
  m_tiles[tile] = terrain;
}

void TerrainSet::removeTile(TileId tile)
{
  m_tiles.erase(tile);
  m_probabilities.erase(tile);
}

const TileTerrain* TerrainSet::tileTerrain(TileId tile) const
{
  const auto it = m_tiles.find(tile);
  if (it == m_tiles.end()) return nullptr;
  return &it->second;
}

void TerrainSet::setTileProbability(TileId tile, float probability)
{
  m_probabilities[tile] = probability;
}

float TerrainSet::tileProbability(TileId tile) const
{
  const auto it = m_probabilities.find(tile);
  if (it == m_probabilities.end()) return 1.0f;
  return it->second;
}

void TerrainSet::setTransitionPenalty(int fromTerrain, int toTerrain, float penalty)
{
  m_penalties[std::make_pair(fromTerrain, toTerrain)] = penalty;
}

float TerrainSet::transitionPenalty(int fromTerrain, int toTerrain) const
{
  if (fromTerrain == toTerrain) return 0.0f;
  const auto it = m_penalties.find(std::make_pair(fromTerrain, toTerrain));
  if (it != m_penalties.end()) return it->second;
  return m_defaultPenalty;
}

WangId TerrainSet::toWangId(const TileTerrain& terrain) const
{
  WangId w;
  const std::array<int, 8>& layout = TerrainSlotLayout(m_type);
  const int n = TerrainSlotCount(m_type);
  for (int slot = 0; slot < n; ++slot) {
    const int t = terrain.get(slot);
    if (t < 0) continue;
    w.setColor(layout[static_cast<std::size_t>(slot)], TerrainColorForIndex(t));
  }
  return w;
}

bool TerrainSet::tileWangId(TileId tile, WangId& out) const
{
  const TileTerrain* t = tileTerrain(tile);
  if (!t) return false;
  out = toWangId(*t);
  return true;
}

} // namespace wangpaint
