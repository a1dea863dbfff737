#include "wangpaint/GridDiff.hpp"

#include <algorithm>

namespace wangpaint {

GridDiffStats DiffTileGrids(const TileGrid& a, const TileGrid& b, bool collectCells)
{
  GridDiffStats d{};
  d.widthA = a.width();
  d.heightA = a.height();
  d.widthB = b.width();
  d.heightB = b.height();
  d.sizeMismatch = (d.widthA != d.widthB) || (d.heightA != d.heightB);

  const int w = std::min(d.widthA, d.widthB);
  const int h = std::min(d.heightA, d.heightB);
  if (w <= 0 || h <= 0) return d;

  d.cellsCompared = w * h;

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const TileId ta = a.get(x, y);
      const TileId tb = b.get(x, y);
      if (ta == tb) continue;

      ++d.cellsDifferent;
      if (ta == kNoTile) {
        ++d.filled;
      } else if (tb == kNoTile) {
        ++d.cleared;
      } else {
        ++d.retiled;
      }

      if (collectCells) d.changed.push_back(Point{x, y});
    }
  }

  return d;
}

} // namespace wangpaint
