#include "em/style/ColorMapper.hpp"
#include "em/math/Normalize.hpp"

#include <utility>

namespace em {

ColorMapper::ColorMapper(ColorPalette palette)
  : palette_(std::move(palette)) {}

double ColorMapper::normalize(double value, double minVal, double maxVal) {
  return normalizeClamped(value, minVal, maxVal);
}

int ColorMapper::bucketForBoundaries(double value, const std::vector<double>& boundaries) {
  if (boundaries.size() < 3) return 0;

  // Count interior boundaries at or below value.
  int idx = 0;
  for (std::size_t i = 1; i + 1 < boundaries.size(); i++) {
    if (boundaries[i] <= value) idx = static_cast<int>(i);
  }
  return idx;
}

int ColorMapper::bucketIndex(double normalized) const {
  if (palette_.colors.empty()) return 0;

  int idx;
  if (palette_.thresholds.size() == palette_.colors.size() + 1) {
    idx = bucketForBoundaries(normalized, palette_.thresholds);
  } else {
    // Evenly spaced buckets when the palette carries no usable thresholds.
    int n = static_cast<int>(palette_.colors.size());
    idx = static_cast<int>(normalized * static_cast<double>(n));
  }

  int last = static_cast<int>(palette_.colors.size()) - 1;
  if (idx < 0) idx = 0;
  if (idx > last) idx = last;
  return idx;
}

std::string ColorMapper::colorForValue(double value, double minVal, double maxVal) const {
  if (value == 0.0 || palette_.colors.empty()) return palette_.zeroValueColor;
  return palette_.colors[static_cast<std::size_t>(
      bucketIndex(normalize(value, minVal, maxVal)))];
}

std::string ColorMapper::colorForRegionalValue(double value, const std::string& region,
                                               const RegionMinMax& minMaxByRegion) const {
  ValueRange range{0.0, 0.0};
  auto it = minMaxByRegion.find(region);
  if (it != minMaxByRegion.end()) range = it->second;
  return colorForValue(value, range.min, range.max);
}

std::string ColorMapper::colorForThresholds(double value, const std::string& region,
                                            const ColorThresholds& thresholds) const {
  return colorForBoundaries(value, thresholds.boundariesFor(region));
}

std::string ColorMapper::colorForLayerThresholds(double value, const std::string& region,
                                                 const ColorThresholds& thresholds) const {
  return colorForBoundaries(value, thresholds.layerBoundariesFor(region));
}

std::string ColorMapper::colorForBoundaries(double value, const std::vector<double>& b) const {
  if (value == 0.0 || palette_.colors.empty()) return palette_.zeroValueColor;

  if (b.size() == palette_.colors.size() + 1) {
    int idx = bucketForBoundaries(value, b);
    return palette_.colors[static_cast<std::size_t>(idx)];
  }
  if (b.size() >= 2) return colorForValue(value, b.front(), b.back());
  return colorForValue(value, 0.0, 0.0);
}

StateColors ColorMapper::stateColors() const {
  StateColors s;
  s.notInRegion = palette_.notInRegionColor;
  s.existsNoData = palette_.existsNoDataColor;
  s.existsNoDataStroke = palette_.existsNoDataStroke;
  s.zeroValue = palette_.zeroValueColor;
  return s;
}

std::vector<double> ColorMapper::legendValues(double minVal, double maxVal) const {
  std::vector<double> out;
  out.reserve(palette_.thresholds.size());
  for (double t : palette_.thresholds) {
    if (maxVal <= minVal) {
      out.push_back(minVal);
    } else {
      out.push_back(minVal + t * (maxVal - minVal));
    }
  }
  return out;
}

} // namespace em
