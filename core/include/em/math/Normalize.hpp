#pragma once
#include <algorithm>

namespace em {

// Map a value from [minVal, maxVal] to [0, 1], clamped at both ends.
// A flat or inverted range yields 0.
inline double normalizeClamped(double value, double minVal, double maxVal) {
  if (maxVal <= minVal) return 0.0;
  double t = (value - minVal) / (maxVal - minVal);
  return std::max(0.0, std::min(1.0, t));
}

} // namespace em
