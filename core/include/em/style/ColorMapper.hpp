#pragma once
#include "em/style/ColorPalette.hpp"
#include "em/style/ColorScale.hpp"

#include <string>
#include <vector>

namespace em {

// Maps metric values to palette colors. Every mapping is total: degenerate
// ranges, unknown regions and out-of-range values are clamped or defaulted.
//
// Bucket i covers [thresholds[i], thresholds[i+1]); the last bucket also
// includes its upper bound. Zero always maps to the zero-value sentinel.
class ColorMapper {
public:
  explicit ColorMapper(ColorPalette palette = redPalette());

  const ColorPalette& palette() const { return palette_; }

  static double normalize(double value, double minVal, double maxVal);

  // Bucket for a value already normalized to [0, 1].
  int bucketIndex(double normalized) const;

  // Bucket against arbitrary boundaries (N+1 values -> N buckets).
  static int bucketForBoundaries(double value, const std::vector<double>& boundaries);

  std::string colorForValue(double value, double minVal, double maxVal) const;

  // Unknown regions use a 0/0 range, so any non-zero value is the lightest bucket.
  std::string colorForRegionalValue(double value, const std::string& region,
                                    const RegionMinMax& minMaxByRegion) const;

  // Raw boundaries are used directly when they match the palette size;
  // otherwise their first/last values serve as the normalization range.
  std::string colorForThresholds(double value, const std::string& region,
                                 const ColorThresholds& thresholds) const;

  // Same rule against thresholds.layerBoundariesFor(region).
  std::string colorForLayerThresholds(double value, const std::string& region,
                                      const ColorThresholds& thresholds) const;

  std::string colorForBoundaries(double value, const std::vector<double>& boundaries) const;

  StateColors stateColors() const;

  // Palette thresholds mapped back to metric units for a legend.
  std::vector<double> legendValues(double minVal, double maxVal) const;

private:
  ColorPalette palette_;
};

} // namespace em
