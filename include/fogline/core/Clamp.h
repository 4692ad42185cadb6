#pragma once

namespace fogline::core {

// Clamp without std::clamp's same-type overload pitfalls at mixed-width call sites.
template <class T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

constexpr double clamp01(double v) { return clamp(v, 0.0, 1.0); }

// Trust-style signed unit interval.
constexpr double clampSigned01(double v) { return clamp(v, -1.0, 1.0); }

} // namespace fogline::core
