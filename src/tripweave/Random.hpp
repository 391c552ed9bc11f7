#pragma once

#include <cstdint>

namespace tripweave {

// SplitMix64: small, fast generator. Used to seed restart constructions so a
// planning run is reproducible for a given seed.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Derive an independent stream seed (e.g. one per restart) from a base seed.
inline std::uint64_t DeriveSeed(std::uint64_t base, std::uint64_t stream)
{
  std::uint64_t s = base ^ (stream * 0xD6E8FEB86659FD93ULL);
  return SplitMix64Next(s);
}

struct RNG {
  std::uint64_t state = 0;

  explicit RNG(std::uint64_t seed)
      : state(seed ? seed : 0x12345678ABCDEF00ULL)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  // [0, 1) with 53 bits of precision.
  double nextF64()
  {
    return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
  }

  double rangeF64(double minInclusive, double maxExclusive)
  {
    return minInclusive + (maxExclusive - minInclusive) * nextF64();
  }
};

} // namespace tripweave
