#include "wangpaint/TileGrid.hpp"

#include <algorithm>

namespace wangpaint {

TileGrid::TileGrid(int w, int h)
    : m_w(std::max(0, w))
    , m_h(std::max(0, h))
{
  m_tiles.assign(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h), kNoTile);
}

TileId TileGrid::get(int x, int y) const
{
  if (!inBounds(x, y)) return kNoTile;
  return m_tiles[index(x, y)];
}

void TileGrid::set(int x, int y, TileId tile)
{
  if (!inBounds(x, y)) return;
  m_tiles[index(x, y)] = tile;
}

void TileGrid::fill(TileId tile)
{
  std::fill(m_tiles.begin(), m_tiles.end(), tile);
}

int TileGrid::countFilled() const
{
  return static_cast<int>(std::count_if(m_tiles.begin(), m_tiles.end(), [](TileId t) { return t != kNoTile; }));
}

} // namespace wangpaint
