#include "wangpaint/WangFiller.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace wangpaint {

namespace {

inline int TerrainIndexOfColor(TerrainId c)
{
  return static_cast<int>(c) - 1;
}

} // namespace

std::string FormatWangId(const WangId& w)
{
  std::ostringstream oss;
  oss << '[';
  for (int i = 0; i < kWangPositionCount; ++i) {
    if (i) oss << ',';
    oss << static_cast<int>(w.colorAt(i));
  }
  oss << ']';
  return oss.str();
}

WangFiller::WangFiller(const TerrainSet& terrainSet, int width, int height, std::uint64_t seed)
    : m_set(&terrainSet)
    , m_w(std::max(0, width))
    , m_h(std::max(0, height))
    , m_seed(seed)
    , m_rng(seed)
{
}

CellInfo* WangFiller::cell(int x, int y)
{
  if (!inBounds(x, y)) return nullptr;
  return &m_cells[index(x, y)];
}

const CellInfo* WangFiller::cell(int x, int y) const
{
  static const CellInfo kEmpty{};
  if (!inBounds(x, y)) return nullptr;
  const auto it = m_cells.find(index(x, y));
  return (it != m_cells.end()) ? &it->second : &kEmpty;
}

void WangFiller::traceLine(const std::string& line) const
{
  if (m_trace) m_trace(line);
}

void WangFiller::traceConstraints(const CellInfo& cell) const
{
  const TerrainSetType type = m_set->type();
  std::ostringstream oss;
  oss << "match: constraints (type " << ToString(type) << ")";
  traceLine(oss.str());

  for (int i = 0; i < kWangPositionCount; ++i) {
    if (!IsActiveWangIndex(type, i)) continue;
    const int want = static_cast<int>(cell.desired.colorAt(i));
    std::ostringstream line;
    if (cell.isConstrained(i)) {
      line << "  pos " << i << ": hard " << want << " (terrain " << (want > 0 ? want - 1 : 0) << ")";
    } else if (want != 0) {
      line << "  pos " << i << ": soft " << want << " (terrain " << (want - 1) << ")";
    } else {
      continue;
    }
    traceLine(line.str());
  }
}

std::optional<float> WangFiller::scoreTile(const CellInfo& cell, const WangId& tile) const
{
  const TerrainSetType type = m_set->type();
  float penalty = 0.0f;

  for (int i = 0; i < kWangPositionCount; ++i) {
    if (!IsActiveWangIndex(type, i)) continue;

    const TerrainId want = cell.desired.colorAt(i);
    const TerrainId have = tile.colorAt(i);

    if (cell.isConstrained(i)) {
      // Hard: exact match, including 0 == 0.
      if (want != have) return std::nullopt;
      continue;
    }

    if (want == 0 || want == have) continue;

    // Soft preference. A tile with no terrain here pays a flat 1.
    if (have == 0) {
      penalty += 1.0f;
      continue;
    }
    penalty += m_set->transitionPenalty(TerrainIndexOfColor(want), TerrainIndexOfColor(have));
  }

  return penalty;
}

std::optional<TileId> WangFiller::randomPick(const std::vector<Candidate>& candidates)
{
  if (candidates.empty()) return std::nullopt;
  if (candidates.size() == 1) return candidates.front().tile;

  float total = 0.0f;
  for (const Candidate& c : candidates) total += c.weight;
  if (total <= 0.0f) return candidates.front().tile;

  float r = m_rng.nextF01() * total;
  for (const Candidate& c : candidates) {
    r -= c.weight;
    if (r <= 0.0f) return c.tile;
  }

  // Float rounding can leave a sliver of r; the last candidate absorbs it.
  return candidates.back().tile;
}

std::optional<TileId> WangFiller::findBestMatch(const CellInfo& cell)
{
  if (tracing()) traceConstraints(cell);

  std::vector<Candidate> candidates;
  float bestPenalty = std::numeric_limits<float>::max();
  int rejected = 0;

  for (const auto& kv : m_set->tileTerrains()) {
    const TileId tileId = kv.first;
    const TileTerrain& terrain = kv.second;
    if (!terrain.hasAnyTerrain()) continue;

    const WangId tileWang = m_set->toWangId(terrain);
    const std::optional<float> score = scoreTile(cell, tileWang);

    if (!score) {
      ++rejected;
      if (tracing()) {
        std::ostringstream oss;
        oss << "  tile " << tileId << " rejected wang=" << FormatWangId(tileWang);
        traceLine(oss.str());
      }
      continue;
    }

    const float penalty = *score;
    if (tracing()) {
      std::ostringstream oss;
      oss << "  tile " << tileId << " accepted penalty=" << penalty << " wang=" << FormatWangId(tileWang);
      traceLine(oss.str());
    }

    if (penalty < bestPenalty) {
      bestPenalty = penalty;
      candidates.clear();
    }
    if (std::fabs(penalty - bestPenalty) < std::numeric_limits<float>::epsilon()) {
      const float weight = m_set->tileProbability(tileId) / (1.0f + penalty);
      candidates.push_back(Candidate{tileId, weight});
    }
  }

  if (tracing()) {
    std::ostringstream oss;
    oss << "match: " << candidates.size() << " candidates, " << rejected << " rejected";
    traceLine(oss.str());
  }

  const std::optional<TileId> result = randomPick(candidates);

  if (tracing()) {
    if (result) {
      traceLine("match: selected " + std::to_string(*result));
    } else {
      traceLine("match: no tile found");
    }
  }

  return result;
}

bool WangFiller::ViolatesConstraints(const CellInfo& cell, const WangId& tile)
{
  for (int i = 0; i < kWangPositionCount; ++i) {
    if (!cell.isConstrained(i)) continue;
    const TerrainId want = cell.desired.colorAt(i);
    if (want != 0 && want != tile.colorAt(i)) return true;
  }
  return false;
}

WangId WangFiller::surroundings(const TileGrid& grid, int x, int y) const
{
  WangId result;

  for (int i = 0; i < kWangPositionCount; ++i) {
    const auto& off = kWangNeighborOffsets[static_cast<std::size_t>(i)];
    const int nx = x + off[0];
    const int ny = y + off[1];
    if (!inBounds(nx, ny)) continue;

    const TileId neighbor = grid.get(nx, ny);
    if (neighbor == kNoTile) continue;

    WangId neighborWang;
    if (!m_set->tileWangId(neighbor, neighborWang)) continue;

    // The neighbor's facing position continues into this cell.
    const TerrainId c = neighborWang.colorAt(OppositeWangIndex(i));
    if (c != 0) result.setColor(i, c);
  }

  return result;
}

bool WangFiller::apply(TileGrid& grid, const std::vector<Point>& region)
{
  if (grid.width() != m_w || grid.height() != m_h) return false;

  m_stats = FillStats{};
  m_inRegion.clear();
  m_queued.clear();
  m_corrections.clear();

  for (const Point& p : region) {
    if (inBounds(p.x, p.y)) m_inRegion.insert(index(p.x, p.y));
  }

  // ---------------------------------------------------------------------------
  // Phase 1: constraints from existing content (soft only)
  // ---------------------------------------------------------------------------
  for (const Point& p : region) {
    if (!inBounds(p.x, p.y)) continue;
    CellInfo& info = m_cells[index(p.x, p.y)];

    // Existing tile data influences the pick but never forces it: no mask bits.
    const TileId existing = grid.get(p.x, p.y);
    WangId existingWang;
    if (existing != kNoTile && m_set->tileWangId(existing, existingWang)) {
      for (int i = 0; i < kWangPositionCount; ++i) {
        const TerrainId c = existingWang.colorAt(i);
        if (c != 0) info.setPreference(i, c);
      }
    }

    const WangId around = surroundings(grid, p.x, p.y);
    for (int i = 0; i < kWangPositionCount; ++i) {
      const TerrainId c = around.colorAt(i);
      if (c != 0) info.setPreference(i, c);
    }
  }

  // ---------------------------------------------------------------------------
  // Phase 2: place tiles and propagate hard constraints to neighbors
  // ---------------------------------------------------------------------------
  for (const Point& p : region) {
    if (!inBounds(p.x, p.y)) continue;
    ++m_stats.regionCells;

    // Copy: propagation from this placement may write into m_cells.
    const CellInfo info = m_cells[index(p.x, p.y)];
    const std::optional<TileId> chosen = findBestMatch(info);
    if (!chosen) {
      ++m_stats.unmatched;
      continue;
    }

    grid.set(p.x, p.y, *chosen);
    ++m_stats.placed;

    WangId chosenWang;
    if (!m_set->tileWangId(*chosen, chosenWang)) continue;

    for (int dir = 0; dir < kWangPositionCount; ++dir) {
      const auto& off = kWangNeighborOffsets[static_cast<std::size_t>(dir)];
      const int nx = p.x + off[0];
      const int ny = p.y + off[1];
      if (!inBounds(nx, ny)) continue;

      const TileId neighborTile = grid.get(nx, ny);
      if (neighborTile == kNoTile) continue;

      const std::size_t nidx = index(nx, ny);
      CellInfo& neighbor = m_cells[nidx];
      neighbor.setConstraint(OppositeWangIndex(dir), chosenWang.colorAt(dir));

      // Only cells outside the region are candidates for correction.
      if (m_inRegion.count(nidx) || m_queued.count(nidx)) continue;

      WangId neighborWang;
      if (!m_set->tileWangId(neighborTile, neighborWang)) continue;
      if (ViolatesConstraints(neighbor, neighborWang)) {
        m_queued.insert(nidx);
        m_corrections.push_back(Point{nx, ny});
      }
    }
  }

  m_stats.correctionsQueued = static_cast<int>(m_corrections.size());

  // ---------------------------------------------------------------------------
  // Phase 3: single-pass corrections (no cascading)
  // ---------------------------------------------------------------------------
  const std::vector<Point> corrections = std::move(m_corrections);
  m_corrections.clear();

  for (const Point& p : corrections) {
    if (!inBounds(p.x, p.y)) continue;
    const std::size_t idx = index(p.x, p.y);
    if (m_inRegion.count(idx)) continue;

    const TileId current = grid.get(p.x, p.y);
    if (current == kNoTile) continue;

    WangId currentWang;
    if (!m_set->tileWangId(current, currentWang)) continue;

    const CellInfo info = m_cells[idx];
    if (!ViolatesConstraints(info, currentWang)) continue;

    if (tracing()) {
      std::ostringstream oss;
      oss << "correct (" << p.x << "," << p.y << ") tile " << current;
      traceLine(oss.str());
    }

    const std::optional<TileId> fix = findBestMatch(info);
    if (fix) {
      grid.set(p.x, p.y, *fix);
      ++m_stats.correctionsApplied;
    }
  }

  return true;
}

} // namespace wangpaint
