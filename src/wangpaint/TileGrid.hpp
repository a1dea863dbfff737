#pragma once

#include "wangpaint/Types.hpp"

#include <cstddef>
#include <vector>

namespace wangpaint {

// Rectangular tile layer: width x height cells, row-major, each cell either a
// tile id or kNoTile. Y-up: row 0 is the bottom row.
class TileGrid {
public:
  TileGrid() = default;
  TileGrid(int w, int h);

  int width() const { return m_w; }
  int height() const { return m_h; }
  std::size_t cellCount() const { return m_tiles.size(); }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_w && y < m_h; }
  bool inBounds(Point p) const { return inBounds(p.x, p.y); }

  std::size_t index(int x, int y) const { return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(x); }

  // Out-of-bounds reads return kNoTile; out-of-bounds writes are ignored.
  TileId get(int x, int y) const;
  bool has(int x, int y) const { return get(x, y) != kNoTile; }
  void set(int x, int y, TileId tile);
  void clear(int x, int y) { set(x, y, kNoTile); }

  void fill(TileId tile);
  int countFilled() const;

  const std::vector<TileId>& tiles() const { return m_tiles; }
  std::vector<TileId>& tiles() { return m_tiles; }

private:
  int m_w = 0;
  int m_h = 0;
  std::vector<TileId> m_tiles;
};

inline bool operator==(const TileGrid& a, const TileGrid& b)
{
  return a.width() == b.width() && a.height() == b.height() && a.tiles() == b.tiles();
}
inline bool operator!=(const TileGrid& a, const TileGrid& b) { return !(a == b); }

} // namespace wangpaint
