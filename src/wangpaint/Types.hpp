#pragma once

#include <cstdint>

namespace wangpaint {

// Simple integer grid coordinate.
//
// Grids are Y-up: (0,0) is the bottom-left cell and y+1 is the row above.
struct Point {
  int x = 0;
  int y = 0;
};

inline bool operator==(Point a, Point b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Point a, Point b) { return !(a == b); }

// Tile identifier inside a terrain set / tile layer.
using TileId = std::uint32_t;

// Sentinel stored in a grid cell that holds no tile.
constexpr TileId kNoTile = 0xFFFFFFFFu;

} // namespace wangpaint
