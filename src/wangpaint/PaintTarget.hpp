#pragma once

#include "wangpaint/TerrainSet.hpp"
#include "wangpaint/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wangpaint {

enum class PaintTargetKind : std::uint8_t {
  Corner = 0,         // intersection shared by up to 4 cells
  HorizontalEdge = 1, // boundary between a cell and the one above it
  VerticalEdge = 2,   // boundary between a cell and the one to its right
};

inline constexpr std::uint8_t PaintTargetKindCountU8() { return 3; }

const char* ToString(PaintTargetKind k);
bool ParsePaintTargetKind(const std::string& s, PaintTargetKind& out);

// What a terrain brush stroke lands on.
//
// Field meaning depends on the kind:
//   Corner:          (x, y) = (corner_x, corner_y)
//   HorizontalEdge:  (x, y) = (tile_x,   edge_y)
//   VerticalEdge:    (x, y) = (edge_x,   tile_y)
//
// Corner (cx,cy) is the bottom-left corner of cell (cx,cy); edge_y is the
// bottom edge of row edge_y; edge_x is the left edge of column edge_x.
struct PaintTarget {
  PaintTargetKind kind = PaintTargetKind::Corner;
  std::uint32_t x = 0;
  std::uint32_t y = 0;

  static PaintTarget Corner(std::uint32_t cornerX, std::uint32_t cornerY)
  {
    return PaintTarget{PaintTargetKind::Corner, cornerX, cornerY};
  }
  static PaintTarget HorizontalEdge(std::uint32_t tileX, std::uint32_t edgeY)
  {
    return PaintTarget{PaintTargetKind::HorizontalEdge, tileX, edgeY};
  }
  static PaintTarget VerticalEdge(std::uint32_t edgeX, std::uint32_t tileY)
  {
    return PaintTarget{PaintTargetKind::VerticalEdge, edgeX, tileY};
  }
};

inline bool operator==(const PaintTarget& a, const PaintTarget& b)
{
  return a.kind == b.kind && a.x == b.x && a.y == b.y;
}
inline bool operator!=(const PaintTarget& a, const PaintTarget& b) { return !(a == b); }

// "corner(3,4)", "hedge(3,4)", "vedge(3,4)"
std::string ToString(const PaintTarget& t);

// Map a world position (Y-up, tile (0,0) spans [0,tileSize)^2) to the corner
// or edge the brush should paint for this terrain set mode.
//
//  Corner mode: nearest corner.
//  Edge mode:   the nearer of the horizontal/vertical candidates.
//  Mixed mode:  3x3 zones per tile; outer corner zones pick corners, outer
//               middle zones pick edges, the centre snaps to the nearest corner.
//
// Coordinates are clamped to >= 0. Callers still need to check the grid size.
// Non-positive tile sizes are treated as 1 and non-finite positions as 0.
PaintTarget ResolvePaintTarget(float worldX, float worldY, float tileSize, TerrainSetType type);

// One cell touched by a target, and the clock position the paint pins on it.
struct AffectedCell {
  Point cell;
  int position = 0;
};

// In-bounds cells touched by `target` on a width x height grid, in the order
// the filler visits them:
//   Corner (cx,cy):         (cx-1,cy-1)@TopRight (cx,cy-1)@TopLeft
//                           (cx-1,cy)@BottomRight (cx,cy)@BottomLeft
//   HorizontalEdge (tx,ey): (tx,ey-1)@Top (tx,ey)@Bottom
//   VerticalEdge (ex,ty):   (ex-1,ty)@Right (ex,ty)@Left
std::vector<AffectedCell> AffectedCells(const PaintTarget& target, int width, int height);

// Deterministic RNG seed for a paint at `target`. Each kind sets different
// high bits so coincident corner/edge coordinates do not share a seed.
std::uint64_t PaintSeed(const PaintTarget& target);

} // namespace wangpaint
