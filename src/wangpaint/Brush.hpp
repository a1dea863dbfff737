#pragma once

#include "wangpaint/PaintTarget.hpp"
#include "wangpaint/TerrainSet.hpp"
#include "wangpaint/Types.hpp"

#include <cstdlib>
#include <vector>

namespace wangpaint {

// Raster helpers for dragging the terrain brush across the corner lattice.
//
// Corner (x,y) is the bottom-left corner of cell (x,y), so a stroke is a line
// over corner coordinates. Successive corners are 4-adjacent, which means the
// segment between them is exactly one cell edge.

// Walk an inclusive integer line from a to b, calling fn(Point) in order.
// Diagonal Bresenham steps are split into two axis steps (dominant axis first),
// so consecutive points always share an edge.
template <typename Fn>
inline void ForEachLinePoint(Point a, Point b, Fn&& fn)
{
  int x0 = a.x;
  int y0 = a.y;
  const int x1 = b.x;
  const int y1 = b.y;

  const int dx = std::abs(x1 - x0);
  const int dy = std::abs(y1 - y0);
  const int sx = (x0 < x1) ? 1 : -1;
  const int sy = (y0 < y1) ? 1 : -1;
  const bool dominantX = (dx >= dy);

  int err = dx - dy;

  for (;;) {
    fn(Point{x0, y0});
    if (x0 == x1 && y0 == y1) break;

    const int e2 = err * 2;
    const bool stepX = (e2 > -dy);
    const bool stepY = (e2 < dx);

    if (stepX && stepY) {
      if (dominantX) {
        err -= dy;
        x0 += sx;
        fn(Point{x0, y0});
        err += dx;
        y0 += sy;
      } else {
        err += dx;
        y0 += sy;
        fn(Point{x0, y0});
        err -= dy;
        x0 += sx;
      }
      continue;
    }

    if (stepX) {
      err -= dy;
      x0 += sx;
    }
    if (stepY) {
      err += dx;
      y0 += sy;
    }
  }
}

inline std::vector<Point> RasterLine(Point a, Point b)
{
  std::vector<Point> out;
  out.reserve(static_cast<std::size_t>(std::abs(b.x - a.x) + std::abs(b.y - a.y) + 1));
  ForEachLinePoint(a, b, [&](Point p) { out.push_back(p); });
  return out;
}

// The cell edge between two 4-adjacent corners.
// Requires |a.x-b.x| + |a.y-b.y| == 1 and both corners non-negative.
PaintTarget EdgeBetweenCorners(Point a, Point b);

// Paint targets for a brush dragged from corner `from` to corner `to`.
//
//  Corner: every corner on the line.
//  Edge:   every cell edge between successive corners.
//  Mixed:  corners and the edges between them, interleaved in stroke order.
//
// Points with a negative coordinate are skipped, together with any edge that
// touches them. A zero-length stroke in edge mode produces no targets.
std::vector<PaintTarget> StrokeTargets(Point from, Point to, TerrainSetType type);

} // namespace wangpaint
