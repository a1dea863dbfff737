#include "wangpaint/Brush.hpp"

#include <algorithm>

namespace wangpaint {

namespace {

inline bool NonNegative(Point p) { return p.x >= 0 && p.y >= 0; }

} // namespace

PaintTarget EdgeBetweenCorners(Point a, Point b)
{
  if (a.y == b.y) {
    // Horizontal run along the bottom edge of cell (min x, y).
    return PaintTarget::HorizontalEdge(static_cast<std::uint32_t>(std::min(a.x, b.x)), static_cast<std::uint32_t>(a.y));
  }
  // Vertical run along the left edge of cell (x, min y).
  return PaintTarget::VerticalEdge(static_cast<std::uint32_t>(a.x), static_cast<std::uint32_t>(std::min(a.y, b.y)));
}

std::vector<PaintTarget> StrokeTargets(Point from, Point to, TerrainSetType type)
{
  const std::vector<Point> corners = RasterLine(from, to);

  std::vector<PaintTarget> out;
  out.reserve(corners.size() * 2);

  const bool wantCorners = (type != TerrainSetType::Edge);
  const bool wantEdges = (type != TerrainSetType::Corner);

  for (std::size_t i = 0; i < corners.size(); ++i) {
    const Point c = corners[i];

    if (wantEdges && i > 0) {
      const Point prev = corners[i - 1];
      if (NonNegative(prev) && NonNegative(c)) out.push_back(EdgeBetweenCorners(prev, c));
    }

    if (wantCorners && NonNegative(c)) {
      out.push_back(PaintTarget::Corner(static_cast<std::uint32_t>(c.x), static_cast<std::uint32_t>(c.y)));
    }
  }

  return out;
}

} // namespace wangpaint
