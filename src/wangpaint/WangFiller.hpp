#pragma once

#include "wangpaint/Random.hpp"
#include "wangpaint/TerrainSet.hpp"
#include "wangpaint/TileGrid.hpp"
#include "wangpaint/Types.hpp"
#include "wangpaint/WangId.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace wangpaint {

// Optional diagnostic sink. Receives one line per call, no trailing newline.
using TraceFn = std::function<void(const std::string& line)>;

// Counters for the last WangFiller::apply().
struct FillStats {
  int regionCells = 0;        // in-bounds region cells visited by the placement pass
  int placed = 0;             // region cells that received a tile
  int unmatched = 0;          // region cells where no tile satisfied the constraints
  int correctionsQueued = 0;  // outside cells invalidated by propagation
  int correctionsApplied = 0; // of those, cells that were actually re-tiled
};

// Fills a region of a tile grid with terrain tiles.
//
// apply() runs three phases:
//  1) Build constraints: existing tiles in the region and their neighbors
//     contribute *soft* preferences only.
//  2) Place + propagate: each region cell picks the lowest-penalty tile that
//     satisfies its hard constraints; the placed tile then hard-constrains
//     every non-empty neighbor on the facing position. Neighbors outside the
//     region whose current tile no longer fits are queued.
//  3) Corrections: the queue is drained once. Corrected cells do not
//     propagate further and are never re-queued.
//
// A cell with no satisfying tile keeps its previous content.
//
// The filler owns its constraint storage and RNG; it borrows the terrain set,
// which must outlive it.
class WangFiller {
public:
  WangFiller(const TerrainSet& terrainSet, int width, int height, std::uint64_t seed = 0);

  int width() const { return m_w; }
  int height() const { return m_h; }
  std::uint64_t seed() const { return m_seed; }

  void setTrace(TraceFn fn) { m_trace = std::move(fn); }
  bool tracing() const { return static_cast<bool>(m_trace); }

  // Constraint record for a cell; nullptr when (x,y) is outside the grid.
  // Records are created on first mutable access; the const overload returns a
  // shared empty record for cells nothing has touched.
  CellInfo* cell(int x, int y);
  const CellInfo* cell(int x, int y) const;

  // Penalty for placing a tile with colors `tile` into `cell`, or nullopt if it
  // breaks a hard constraint. Only positions active for the set's mode count.
  std::optional<float> scoreTile(const CellInfo& cell, const WangId& tile) const;

  // Weighted random pick among the minimum-penalty tiles of the set.
  std::optional<TileId> findBestMatch(const CellInfo& cell);

  // True if any masked, non-zero desired color differs from `tile`.
  static bool ViolatesConstraints(const CellInfo& cell, const WangId& tile);

  // Run the three phases over `region` (order matters; duplicates are harmless).
  // Returns false, without touching the grid, when the grid size differs from
  // the filler's.
  bool apply(TileGrid& grid, const std::vector<Point>& region);

  const FillStats& stats() const { return m_stats; }

private:
  struct Candidate {
    TileId tile = kNoTile;
    float weight = 0.0f;
  };

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_w && y < m_h; }
  std::size_t index(int x, int y) const
  {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(x);
  }

  // Colors facing (x,y) from its 8 neighbors.
  WangId surroundings(const TileGrid& grid, int x, int y) const;

  std::optional<TileId> randomPick(const std::vector<Candidate>& candidates);

  void traceLine(const std::string& line) const;
  void traceConstraints(const CellInfo& cell) const;

  const TerrainSet* m_set = nullptr;
  int m_w = 0;
  int m_h = 0;
  std::uint64_t m_seed = 0;
  RNG m_rng;

  // Sparse constraint map keyed by y*width+x. A paint touches a handful of
  // cells, so storage scales with the region rather than the grid.
  std::unordered_map<std::size_t, CellInfo> m_cells;

  // Region membership + correction queue for the current apply().
  std::unordered_set<std::size_t> m_inRegion;
  std::unordered_set<std::size_t> m_queued;
  std::vector<Point> m_corrections;

  TraceFn m_trace;
  FillStats m_stats;
};

// "[c0,c1,...,c7]"
std::string FormatWangId(const WangId& w);

} // namespace wangpaint
