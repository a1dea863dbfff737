#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace wangpaint {

// Terrain color stored at one position of a tile.
//  0  = no terrain / wildcard
//  N  = terrain index N-1
using TerrainId = std::uint8_t;

inline TerrainId TerrainColorForIndex(int terrainIndex)
{
  return static_cast<TerrainId>(terrainIndex + 1);
}

// Clock positions around a cell, clockwise from the top:
//
//   7|0|1
//   6|X|2
//   5|4|3
//
// Even indices are edges, odd indices are corners.
enum class WangPosition : std::uint8_t {
  Top = 0,
  TopRight = 1,
  Right = 2,
  BottomRight = 3,
  Bottom = 4,
  BottomLeft = 5,
  Left = 6,
  TopLeft = 7,
};

constexpr int kWangPositionCount = 8;

inline int WangIndex(WangPosition p) { return static_cast<int>(p); }

// Index helpers. Every index is taken modulo 8, so out-of-range values wrap
// instead of failing.
inline int WrapWangIndex(int i) { return ((i % 8) + 8) % 8; }
inline int OppositeWangIndex(int i) { return WrapWangIndex(i + 4); }
inline int NextWangIndex(int i) { return WrapWangIndex(i + 1); }
inline int PrevWangIndex(int i) { return WrapWangIndex(i + 7); }
inline bool IsCornerWangIndex(int i) { return (WrapWangIndex(i) % 2) == 1; }

inline WangPosition WangPositionFromIndex(int i) { return static_cast<WangPosition>(WrapWangIndex(i)); }
inline WangPosition Opposite(WangPosition p) { return WangPositionFromIndex(OppositeWangIndex(WangIndex(p))); }
inline WangPosition Next(WangPosition p) { return WangPositionFromIndex(NextWangIndex(WangIndex(p))); }
inline WangPosition Prev(WangPosition p) { return WangPositionFromIndex(PrevWangIndex(WangIndex(p))); }
inline bool IsCorner(WangPosition p) { return IsCornerWangIndex(WangIndex(p)); }

const char* ToString(WangPosition p);

// Terrain colors at the 8 clock positions of one cell.
struct WangId {
  std::array<TerrainId, 8> colors{};

  static WangId Filled(TerrainId color)
  {
    WangId w;
    w.colors.fill(color);
    return w;
  }

  TerrainId colorAt(WangPosition p) const { return colors[static_cast<std::size_t>(WangIndex(p))]; }
  TerrainId colorAt(int i) const { return colors[static_cast<std::size_t>(WrapWangIndex(i))]; }

  void setColor(WangPosition p, TerrainId c) { colors[static_cast<std::size_t>(WangIndex(p))] = c; }
  void setColor(int i, TerrainId c) { colors[static_cast<std::size_t>(WrapWangIndex(i))] = c; }

  bool hasAnyTerrain() const
  {
    for (TerrainId c : colors) {
      if (c != 0) return true;
    }
    return false;
  }

  bool isWildcard() const { return !hasAnyTerrain(); }
};

inline bool operator==(const WangId& a, const WangId& b) { return a.colors == b.colors; }
inline bool operator!=(const WangId& a, const WangId& b) { return !(a == b); }

// All zeros: matches anything.
inline constexpr WangId kWildcardWangId{};

// Constraint record for one cell of a fill.
//
// desired[i] with mask[i] set is a hard constraint: a candidate tile must carry
// exactly that color (0 only matches 0). Without the mask bit a non-zero
// desired color is a soft preference that only adds a penalty when unmet.
struct CellInfo {
  WangId desired;
  std::array<bool, 8> mask{};

  // Hard constraint. Always wins, regardless of call order.
  void setConstraint(int i, TerrainId color)
  {
    const std::size_t k = static_cast<std::size_t>(WrapWangIndex(i));
    desired.colors[k] = color;
    mask[k] = true;
  }
  void setConstraint(WangPosition p, TerrainId color) { setConstraint(WangIndex(p), color); }

  // Soft preference. Never overwrites a hard constraint and never sets the mask.
  void setPreference(int i, TerrainId color)
  {
    const std::size_t k = static_cast<std::size_t>(WrapWangIndex(i));
    if (!mask[k]) desired.colors[k] = color;
  }
  void setPreference(WangPosition p, TerrainId color) { setPreference(WangIndex(p), color); }

  bool isConstrained(int i) const { return mask[static_cast<std::size_t>(WrapWangIndex(i))]; }
  bool isConstrained(WangPosition p) const { return isConstrained(WangIndex(p)); }

  bool hasAnyConstraint() const
  {
    for (bool m : mask) {
      if (m) return true;
    }
    return false;
  }
};

// Neighbor offsets (Y-up) indexed by clock position.
inline constexpr std::array<std::array<int, 2>, 8> kWangNeighborOffsets = {{
    {{0, 1}},   // Top
    {{1, 1}},   // TopRight
    {{1, 0}},   // Right
    {{1, -1}},  // BottomRight
    {{0, -1}},  // Bottom
    {{-1, -1}}, // BottomLeft
    {{-1, 0}},  // Left
    {{-1, 1}},  // TopLeft
}};

} // namespace wangpaint
