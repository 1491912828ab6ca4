#pragma once
/*
================================================================================
Fragment 1.6 - Core: Deterministic RNG
FILE: cpp/engine/core/rng.hpp

SplitMix64: tiny, seedable, identical output on every platform.
================================================================================
*/

#include <cstdint>

namespace gate {

struct SplitMix64 final {
  std::uint64_t s = 0;

  explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ull) : s(seed) {}

  std::uint64_t next_u64() noexcept {
    std::uint64_t z = (s += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  // Uniform in [0, bound). bound == 0 yields 0.
  // Lemire-style rejection keeps the draw unbiased.
  std::uint64_t next_below(std::uint64_t bound) noexcept {
    if (bound == 0) return 0;
    const std::uint64_t limit = ~std::uint64_t{0} - (~std::uint64_t{0} % bound);
    std::uint64_t x = next_u64();
    while (x >= limit) x = next_u64();
    return x % bound;
  }
};

}  // namespace gate
