#include "wangpaint/Hash.hpp"

#include "wangpaint/TerrainSet.hpp"
#include "wangpaint/TileGrid.hpp"

#include <cstring>

namespace wangpaint {

namespace {

// 64-bit FNV-1a
constexpr std::uint64_t kFNVOffset = 1469598103934665603ull;
constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

inline void HashU32(std::uint64_t& h, std::uint32_t v)
{
  HashByte(h, static_cast<std::uint8_t>((v >> 0) & 0xFFu));
  HashByte(h, static_cast<std::uint8_t>((v >> 8) & 0xFFu));
  HashByte(h, static_cast<std::uint8_t>((v >> 16) & 0xFFu));
  HashByte(h, static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

inline void HashI32(std::uint64_t& h, int v)
{
  const std::int32_t sv = static_cast<std::int32_t>(v);
  std::uint32_t uv = 0;
  std::memcpy(&uv, &sv, sizeof(uv));
  HashU32(h, uv);
}

inline void HashF32(std::uint64_t& h, float v)
{
  static_assert(sizeof(float) == 4, "float must be 32-bit");
  std::uint32_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  HashU32(h, bits);
}

} // namespace

std::uint64_t HashTileGrid(const TileGrid& grid)
{
  std::uint64_t h = kFNVOffset;
  HashI32(h, grid.width());
  HashI32(h, grid.height());
  for (const TileId t : grid.tiles()) HashU32(h, t);
  return h;
}

std::uint64_t HashTerrainSet(const TerrainSet& set)
{
  std::uint64_t h = kFNVOffset;
  HashByte(h, static_cast<std::uint8_t>(set.type()));
  HashI32(h, set.terrainCount());
  HashF32(h, set.defaultPenalty());

  // std::map iteration keeps these in key order.
  for (const auto& kv : set.transitionPenalties()) {
    HashI32(h, kv.first.first);
    HashI32(h, kv.first.second);
    HashF32(h, kv.second);
  }

  for (const auto& kv : set.tileTerrains()) {
    HashU32(h, kv.first);
    for (const int s : kv.second.slots) HashI32(h, s);
    HashF32(h, set.tileProbability(kv.first));
  }

  return h;
}

} // namespace wangpaint
