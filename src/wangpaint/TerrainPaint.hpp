#pragma once

#include "wangpaint/PaintTarget.hpp"
#include "wangpaint/TerrainSet.hpp"
#include "wangpaint/TileGrid.hpp"
#include "wangpaint/WangFiller.hpp"

#include <cstdint>
#include <vector>

namespace wangpaint {

struct PaintOptions {
  // When set, the paint and the filler report what they do, one line at a time.
  TraceFn trace;
};

// Terrain brush entry points.
//
// Each paint pins `terrainIndex` onto the affected positions of the cells
// around the target (hard constraints), then lets a WangFiller re-tile exactly
// those cells. Neighbors outside that region may be corrected once if the new
// tiles invalidate them.
//
// The RNG seed is PaintSeed(target), so the same paint on the same grid always
// yields the same tiles.
//
// A target whose cells are all outside the grid is a no-op. Negative or
// unrepresentable terrain indices are rejected and also leave the grid alone.
FillStats PaintTerrainCorner(TileGrid& grid, std::uint32_t cornerX, std::uint32_t cornerY, const TerrainSet& set,
                             int terrainIndex, const PaintOptions& opt = {});

FillStats PaintTerrainHorizontalEdge(TileGrid& grid, std::uint32_t tileX, std::uint32_t edgeY, const TerrainSet& set,
                                     int terrainIndex, const PaintOptions& opt = {});

FillStats PaintTerrainVerticalEdge(TileGrid& grid, std::uint32_t edgeX, std::uint32_t tileY, const TerrainSet& set,
                                   int terrainIndex, const PaintOptions& opt = {});

// Dispatch on target.kind.
FillStats PaintTerrainAtTarget(TileGrid& grid, const PaintTarget& target, const TerrainSet& set, int terrainIndex,
                               const PaintOptions& opt = {});

// Re-pick the tile at (x,y) so it prefers `primaryTerrain` everywhere while
// still fitting its neighbors. Uses seed 0. Out-of-bounds is a no-op.
FillStats UpdateTileWithNeighbors(TileGrid& grid, int x, int y, const TerrainSet& set, int primaryTerrain,
                                  const PaintOptions& opt = {});

// A cell whose tile would change, and the tile it would change to.
struct PreviewTile {
  Point cell;
  TileId tile = kNoTile;
};

inline bool operator==(const PreviewTile& a, const PreviewTile& b) { return a.cell == b.cell && a.tile == b.tile; }

// What PaintTerrainAtTarget would do, without touching `grid`.
//
// Runs the real paint on a scratch copy and reports every cell (row-major)
// whose tile differs afterwards, so the preview also covers corrections made
// outside the painted cells. `opt.trace` sees the same lines the real paint
// would emit.
std::vector<PreviewTile> PreviewTerrainAtTarget(const TileGrid& grid, const PaintTarget& target, const TerrainSet& set,
                                                int terrainIndex, const PaintOptions& opt = {});

// Same, for a sequence of targets painted in order on one scratch copy.
std::vector<PreviewTile> PreviewTerrainAtTargets(const TileGrid& grid, const std::vector<PaintTarget>& targets,
                                                 const TerrainSet& set, int terrainIndex,
                                                 const PaintOptions& opt = {});

} // namespace wangpaint
