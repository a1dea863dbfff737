#pragma once

#include <cstdint>

namespace wangpaint {

// SplitMix64: small, fast, high-quality generator. Used directly as the
// filler's RNG so a given seed reproduces the same tile choices on every
// platform.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

struct RNG {
  std::uint64_t state = 0;

  // Seed 0 is valid: paints at corner (0,0) derive it. SplitMix64 has no
  // degenerate all-zero state, so the seed is used verbatim.
  explicit RNG(std::uint64_t seed)
      : state(seed)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  std::uint32_t nextU32() { return static_cast<std::uint32_t>(nextU64() >> 32); }

  // [0, 1)
  float nextF01()
  {
    // 24-bit mantissa for float
    const std::uint32_t u = nextU32() >> 8;
    return static_cast<float>(u) / static_cast<float>(1u << 24);
  }
};

} // namespace wangpaint
