#include "em/data/MetricStats.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace em {

namespace {

struct RangeAcc {
  double lo{0.0};
  double hi{0.0};
  bool any{false};

  void add(double v) {
    if (!any) { lo = hi = v; any = true; return; }
    lo = std::min(lo, v);
    hi = std::max(hi, v);
  }
};

void finishRanges(const std::map<std::string, RangeAcc>& perRegion, const RangeAcc& global,
                  RegionMinMax& out, ValueRange& globalOut) {
  if (global.any) globalOut = ValueRange{global.lo, global.hi};
  for (const auto& kv : perRegion) {
    out[kv.first] = kv.second.any ? ValueRange{kv.second.lo, kv.second.hi} : globalOut;
  }
}

std::vector<double> boundariesFor(std::vector<double> values, int bucketCount,
                                  ThresholdMethod method) {
  std::vector<double> out;
  if (values.empty() || bucketCount <= 0) return out;

  std::sort(values.begin(), values.end());
  out.reserve(static_cast<std::size_t>(bucketCount) + 1);

  for (int i = 0; i <= bucketCount; i++) {
    double f = static_cast<double>(i) / static_cast<double>(bucketCount);
    if (method == ThresholdMethod::Percentile) {
      out.push_back(percentileOfSorted(values, f * 100.0));
    } else {
      out.push_back(values.front() + f * (values.back() - values.front()));
    }
  }

  // Interpolation noise must not break ordering.
  for (std::size_t i = 1; i < out.size(); i++) {
    if (out[i] < out[i - 1]) out[i] = out[i - 1];
  }
  return out;
}

} // namespace

double percentileOfSorted(const std::vector<double>& sorted, double p) {
  if (sorted.empty()) return 0.0;
  if (sorted.size() == 1) return sorted.front();
  if (p <= 0.0) return sorted.front();
  if (p >= 100.0) return sorted.back();

  double rank = p / 100.0 * static_cast<double>(sorted.size() - 1);
  std::size_t lo = static_cast<std::size_t>(std::floor(rank));
  std::size_t hi = std::min(lo + 1, sorted.size() - 1);
  double frac = rank - static_cast<double>(lo);
  return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

MetricMinMax computeMetricMinMax(const ColumnRecords& records) {
  std::map<std::string, RangeAcc> syn, cell;
  RangeAcc gSyn, gCell;

  for (const auto& r : records) {
    auto& rs = syn[r.region];
    auto& rc = cell[r.region];
    if (r.totalSynapses > 0.0) { rs.add(r.totalSynapses); gSyn.add(r.totalSynapses); }
    if (r.totalNeurons > 0.0) { rc.add(r.totalNeurons); gCell.add(r.totalNeurons); }
  }

  MetricMinMax mm;
  finishRanges(syn, gSyn, mm.synapses, mm.globalSynapses);
  finishRanges(cell, gCell, mm.cells, mm.globalCells);
  return mm;
}

ColorThresholds computeColorThresholds(const ColumnRecords& records, Metric metric,
                                       int bucketCount, ThresholdMethod method) {
  std::vector<double> all;
  std::map<std::string, std::vector<double>> byRegion;
  std::map<std::string, std::vector<double>> layersByRegion;

  for (const auto& r : records) {
    double v = r.metricValue(metric);
    if (v > 0.0) {
      all.push_back(v);
      byRegion[r.region].push_back(v);
    }
    for (const auto& layer : r.layers) {
      double lv = layer.metricValue(metric);
      if (lv > 0.0) layersByRegion[r.region].push_back(lv);
    }
  }

  ColorThresholds t;
  t.all = boundariesFor(all, bucketCount, method);
  for (auto& kv : byRegion) {
    t.byRegion[kv.first] = boundariesFor(std::move(kv.second), bucketCount, method);
  }
  for (auto& kv : layersByRegion) {
    t.layers[kv.first] = boundariesFor(std::move(kv.second), bucketCount, method);
  }
  return t;
}

} // namespace em
