#pragma once

#include "wangpaint/TileGrid.hpp"
#include "wangpaint/Types.hpp"

#include <vector>

namespace wangpaint {

// Per-cell comparison of two tile grids.
//
// Used by the CLI summary and by tests that check a paint stayed inside the
// cells it was allowed to touch.
struct GridDiffStats {
  int widthA = 0;
  int heightA = 0;
  int widthB = 0;
  int heightB = 0;

  // Dimensions differ. Counts then cover the overlapping region only.
  bool sizeMismatch = false;

  int cellsCompared = 0;
  int cellsDifferent = 0;

  // Breakdown of cellsDifferent.
  int filled = 0;  // empty in A, tile in B
  int cleared = 0; // tile in A, empty in B
  int retiled = 0; // different tiles in A and B

  // Row-major list of differing cells, only when requested.
  std::vector<Point> changed;
};

GridDiffStats DiffTileGrids(const TileGrid& a, const TileGrid& b, bool collectCells = false);

} // namespace wangpaint
