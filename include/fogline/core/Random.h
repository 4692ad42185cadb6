#pragma once

#include "fogline/core/Hash.h"
#include "fogline/core/Types.h"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace fogline::core {

// SplitMix64: fast, simple PRNG with 64-bit state.
//
// This is the one shared random source of a simulation. It is passed explicitly
// to every consumer so a fixed seed reproduces a run tick for tick.
// Not suitable for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed = 0) : state_(seed) {}

  void reseed(u64 seed) { state_ = seed; }
  u64 state() const { return state_; }

  u64 nextU64() {
    u64 z = (state_ += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  u32 nextU32() { return static_cast<u32>(nextU64() >> 32); }

  // [0,1)
  double nextDouble() {
    // 53 random bits -> double in [0,1).
    constexpr double inv = 1.0 / static_cast<double>(1ull << 53);
    return static_cast<double>(nextU64() >> 11) * inv;
  }

  // Inclusive range for integers
  template <class Int, std::enable_if_t<std::is_integral_v<Int>, int> = 0>
  Int range(Int minInclusive, Int maxInclusive) {
    if (maxInclusive < minInclusive) std::swap(minInclusive, maxInclusive);
    const u64 span = static_cast<u64>(maxInclusive) - static_cast<u64>(minInclusive) + 1ull;
    return static_cast<Int>(minInclusive + static_cast<Int>(nextU64() % span));
  }

  // Uniform float in [lo, hi).
  double uniform(double lo, double hi) {
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * nextDouble();
  }

  // Bernoulli draw. p <= 0 never fires, p >= 1 always fires.
  bool chance(double p) { return nextDouble() < p; }

  // Index drawn proportionally to non-negative weights.
  // Returns nullopt when no weight is positive.
  std::optional<std::size_t> weightedIndex(std::span<const double> weights) {
    double total = 0.0;
    for (double w : weights) {
      if (w > 0.0) total += w;
    }
    if (total <= 0.0) return std::nullopt;

    double r = nextDouble() * total;
    std::size_t last = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
      if (weights[i] <= 0.0) continue;
      last = i;
      if (r < weights[i]) return i;
      r -= weights[i];
    }
    return last;
  }

private:
  u64 state_{0};
};

inline u64 seedFromText(std::string_view text) { return fnv1a64(text); }

inline u64 deriveSeed(u64 seed, std::string_view salt) { return hashCombine(seed, fnv1a64(salt)); }

} // namespace fogline::core
