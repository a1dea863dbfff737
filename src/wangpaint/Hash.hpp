#pragma once

#include <cstdint>

namespace wangpaint {

class TerrainSet;
class TileGrid;

// Stable, endianness-independent 64-bit FNV-1a hashes.
//
// Used by tests and the CLI to check that the same paint sequence on the same
// input produces the same grid. The exact values are not a file format; compare
// two runs rather than hard-coding constants.

// Dimensions followed by every cell in row-major order (kNoTile included).
std::uint64_t HashTileGrid(const TileGrid& grid);

// Type, terrain count, transition table and every tile's slots + probability.
// The set name and terrain display colors are not part of the hash.
std::uint64_t HashTerrainSet(const TerrainSet& set);

} // namespace wangpaint
