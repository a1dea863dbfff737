#include "wangpaint/TerrainPaint.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace wangpaint {

namespace {

// Terrain indices map to colors 1..255.
inline bool ValidTerrainIndex(int terrainIndex)
{
  return terrainIndex >= 0 && terrainIndex < static_cast<int>(std::numeric_limits<TerrainId>::max());
}

FillStats PaintAffected(TileGrid& grid, const PaintTarget& target, const TerrainSet& set, int terrainIndex,
                        const PaintOptions& opt)
{
  if (!ValidTerrainIndex(terrainIndex)) return FillStats{};

  const TerrainId color = TerrainColorForIndex(terrainIndex);
  const std::uint64_t seed = PaintSeed(target);

  if (opt.trace) {
    const TerrainInfo* info = (terrainIndex < set.terrainCount()) ? &set.terrains()[static_cast<std::size_t>(terrainIndex)] : nullptr;
    std::ostringstream oss;
    oss << "paint " << ToString(target) << " terrain=" << terrainIndex;
    if (info) oss << " (" << info->name << ")";
    oss << " color=" << static_cast<int>(color) << " type=" << ToString(set.type()) << " seed=0x" << std::hex
        << std::setw(16) << std::setfill('0') << seed;
    opt.trace(oss.str());
  }

  const std::vector<AffectedCell> affected = AffectedCells(target, grid.width(), grid.height());
  if (affected.empty()) return FillStats{};

  WangFiller filler(set, grid.width(), grid.height(), seed);
  if (opt.trace) filler.setTrace(opt.trace);

  std::vector<Point> region;
  region.reserve(affected.size());

  for (const AffectedCell& a : affected) {
    CellInfo* info = filler.cell(a.cell.x, a.cell.y);
    if (!info) continue;
    info->setConstraint(a.position, color);
    region.push_back(a.cell);

    if (opt.trace) {
      std::ostringstream oss;
      oss << "constrain (" << a.cell.x << "," << a.cell.y << ") pos=" << a.position << " color="
          << static_cast<int>(color);
      opt.trace(oss.str());
    }
  }

  if (!filler.apply(grid, region)) return FillStats{};
  return filler.stats();
}

} // namespace

FillStats PaintTerrainCorner(TileGrid& grid, std::uint32_t cornerX, std::uint32_t cornerY, const TerrainSet& set,
                             int terrainIndex, const PaintOptions& opt)
{
  return PaintAffected(grid, PaintTarget::Corner(cornerX, cornerY), set, terrainIndex, opt);
}

FillStats PaintTerrainHorizontalEdge(TileGrid& grid, std::uint32_t tileX, std::uint32_t edgeY, const TerrainSet& set,
                                     int terrainIndex, const PaintOptions& opt)
{
  return PaintAffected(grid, PaintTarget::HorizontalEdge(tileX, edgeY), set, terrainIndex, opt);
}

FillStats PaintTerrainVerticalEdge(TileGrid& grid, std::uint32_t edgeX, std::uint32_t tileY, const TerrainSet& set,
                                   int terrainIndex, const PaintOptions& opt)
{
  return PaintAffected(grid, PaintTarget::VerticalEdge(edgeX, tileY), set, terrainIndex, opt);
}

FillStats PaintTerrainAtTarget(TileGrid& grid, const PaintTarget& target, const TerrainSet& set, int terrainIndex,
                               const PaintOptions& opt)
{
  return PaintAffected(grid, target, set, terrainIndex, opt);
}

FillStats UpdateTileWithNeighbors(TileGrid& grid, int x, int y, const TerrainSet& set, int primaryTerrain,
                                  const PaintOptions& opt)
{
  if (!grid.inBounds(x, y)) return FillStats{};
  if (!ValidTerrainIndex(primaryTerrain)) return FillStats{};

  WangFiller filler(set, grid.width(), grid.height(), 0);
  if (opt.trace) filler.setTrace(opt.trace);

  CellInfo* info = filler.cell(x, y);
  if (!info) return FillStats{};

  // Soft only: the neighbors decide where the primary terrain cannot go.
  const TerrainId color = TerrainColorForIndex(primaryTerrain);
  for (int i = 0; i < kWangPositionCount; ++i) info->setPreference(i, color);

  if (!filler.apply(grid, {Point{x, y}})) return FillStats{};
  return filler.stats();
}

std::vector<PreviewTile> PreviewTerrainAtTarget(const TileGrid& grid, const PaintTarget& target, const TerrainSet& set,
                                                int terrainIndex, const PaintOptions& opt)
{
  return PreviewTerrainAtTargets(grid, std::vector<PaintTarget>{target}, set, terrainIndex, opt);
}

std::vector<PreviewTile> PreviewTerrainAtTargets(const TileGrid& grid, const std::vector<PaintTarget>& targets,
                                                 const TerrainSet& set, int terrainIndex, const PaintOptions& opt)
{
  std::vector<PreviewTile> out;
  if (targets.empty()) return out;

  TileGrid scratch = grid;
  for (const PaintTarget& t : targets) {
    PaintTerrainAtTarget(scratch, t, set, terrainIndex, opt);
  }

  for (int y = 0; y < grid.height(); ++y) {
    for (int x = 0; x < grid.width(); ++x) {
      const TileId before = grid.get(x, y);
      const TileId after = scratch.get(x, y);
      if (after != before && after != kNoTile) out.push_back(PreviewTile{Point{x, y}, after});
    }
  }
  return out;
}

} // namespace wangpaint
