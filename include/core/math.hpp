#pragma once

#include <algorithm>
#include <cmath>

namespace flow_control::core {

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

inline bool all_finite(const double a, const double b) noexcept {
  return std::isfinite(a) && std::isfinite(b);
}

// Linear map of [lo, hi] onto [0, 1]; a degenerate range maps to 0.
inline double normalize(const double value, const double lo, const double hi) noexcept {
  if (hi <= lo) {
    return 0.0;
  }
  return clamp01((value - lo) / (hi - lo));
}

inline double denormalize(const double fraction, const double lo, const double hi) noexcept {
  return lo + (clamp01(fraction) * (hi - lo));
}

}  // namespace flow_control::core
