#pragma once

#include "wangpaint/Types.hpp"
#include "wangpaint/WangId.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace wangpaint {

// Which tile positions carry terrain in a set.
//  Corner: the 4 corners (odd clock positions)
//  Edge:   the 4 edges (even clock positions)
//  Mixed:  all 8, corners and edges independent
enum class TerrainSetType : std::uint8_t {
  Corner = 0,
  Edge = 1,
  Mixed = 2,
};

inline constexpr std::uint8_t TerrainSetTypeCountU8() { return 3; }

const char* ToString(TerrainSetType t);

// Case-insensitive; also accepts a few aliases ("corners", "edges", "both").
bool ParseTerrainSetType(const std::string& s, TerrainSetType& out);

// Number of terrain slots a tile carries in this mode (4 or 8).
int TerrainSlotCount(TerrainSetType t);

// Slot -> clock position table for a mode. Unused slots hold -1.
//  Corner: {TL,TR,BL,BR}                  -> {7,1,5,3}
//  Edge:   {Top,Right,Bottom,Left}        -> {0,2,4,6}
//  Mixed:  {TL,Top,TR,Right,BR,Bottom,BL,Left} -> {7,0,1,2,3,4,5,6}
const std::array<int, 8>& TerrainSlotLayout(TerrainSetType t);

// True if clock position i participates in matching for this mode.
bool IsActiveWangIndex(TerrainSetType t, int i);

constexpr int kNoTerrain = -1;

// Per-tile terrain assignment in slot order (see TerrainSlotLayout).
// Each slot is a terrain index or kNoTerrain.
struct TileTerrain {
  std::array<int, 8> slots = {kNoTerrain, kNoTerrain, kNoTerrain, kNoTerrain,
                              kNoTerrain, kNoTerrain, kNoTerrain, kNoTerrain};

  int get(int slot) const
  {
    if (slot < 0 || slot >= 8) return kNoTerrain;
    return slots[static_cast<std::size_t>(slot)];
  }

  bool hasAnyTerrain() const
  {
    for (int s : slots) {
      if (s >= 0) return true;
    }
    return false;
  }

  static TileTerrain Corners(int topLeft, int topRight, int bottomLeft, int bottomRight);
  static TileTerrain Edges(int top, int right, int bottom, int left);
  static TileTerrain Mixed(int topLeft, int top, int topRight, int right, int bottomRight, int bottom,
                           int bottomLeft, int left);

  // Every slot used by `type` set to `terrain`.
  static TileTerrain Uniform(TerrainSetType type, int terrain);
};

struct TerrainInfo {
  std::string name;
  std::uint8_t r = 255;
  std::uint8_t g = 255;
  std::uint8_t b = 255;
};

// Terrain set description consumed by the filler.
//
// Tiles are kept in an ordered map so candidate enumeration (and therefore the
// weighted random pick) is deterministic for a given seed.
class TerrainSet {
public:
  TerrainSet() = default;
  TerrainSet(std::string name, TerrainSetType type);

  const std::string& name() const { return m_name; }
  void setName(std::string name) { m_name = std::move(name); }

  TerrainSetType type() const { return m_type; }
  void setType(TerrainSetType t) { m_type = t; }

  // Terrains (index order is the terrain index).
  int terrainCount() const { return static_cast<int>(m_terrains.size()); }
  const std::vector<TerrainInfo>& terrains() const { return m_terrains; }
  int addTerrain(TerrainInfo info);

  // Tile terrain assignments.
  void setTileTerrain(TileId tile, const TileTerrain& terrain);
  void removeTile(TileId tile);
  // nullptr when the tile has no terrain data in this set.
  const TileTerrain* tileTerrain(TileId tile) const;
  const std::map<TileId, TileTerrain>& tileTerrains() const { return m_tiles; }

  // Selection weight. Tiles without an explicit value weigh 1.
  void setTileProbability(TileId tile, float probability);
  float tileProbability(TileId tile) const;
  bool hasTileProbability(TileId tile) const { return m_probabilities.count(tile) != 0; }

  // Transition penalty between two terrain indices.
  //  - same terrain: 0
  //  - explicit entry: that value
  //  - otherwise: defaultPenalty()
  void setTransitionPenalty(int fromTerrain, int toTerrain, float penalty);
  float transitionPenalty(int fromTerrain, int toTerrain) const;
  const std::map<std::pair<int, int>, float>& transitionPenalties() const { return m_penalties; }

  float defaultPenalty() const { return m_defaultPenalty; }
  void setDefaultPenalty(float p) { m_defaultPenalty = p; }

  // Convert a slot assignment to clock-position colors using this set's mode.
  WangId toWangId(const TileTerrain& terrain) const;

  // Colors of a tile; returns false (and leaves out untouched) when the tile has
  // no terrain data.
  bool tileWangId(TileId tile, WangId& out) const;

private:
  std::string m_name;
  TerrainSetType m_type = TerrainSetType::Corner;
  std::vector<TerrainInfo> m_terrains;
  std::map<TileId, TileTerrain> m_tiles;
  std::map<TileId, float> m_probabilities;
  std::map<std::pair<int, int>, float> m_penalties;
  float m_defaultPenalty = 1.0f;
};

} // namespace wangpaint
