#pragma once
#include "em/data/ColumnTypes.hpp"
#include "em/style/ColorScale.hpp"

#include <vector>

namespace em {

enum class ThresholdMethod : std::uint8_t {
  Percentile, // linear-interpolated percentiles of the positive values
  Equal       // evenly spaced between the positive min and max
};

// Global and per-region ranges of strictly positive totals, for both metrics.
// A region with no positive value inherits the global range; with no positive
// value anywhere the global range stays [0, 1].
MetricMinMax computeMetricMinMax(const ColumnRecords& records);

// bucketCount + 1 non-decreasing boundaries over the positive totals of
// `metric`, globally and per region, plus per-region boundaries over the
// positive sublayer values (`layers`). No positive values -> empty lists.
ColorThresholds computeColorThresholds(const ColumnRecords& records, Metric metric,
                                       int bucketCount = 5,
                                       ThresholdMethod method = ThresholdMethod::Percentile);

// p in [0, 100]; `sorted` must be ascending. Empty input yields 0.
double percentileOfSorted(const std::vector<double>& sorted, double p);

} // namespace em
