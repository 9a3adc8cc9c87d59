#pragma once
#include "em/data/ColumnTypes.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace em {

struct ValueRange {
  double min{0.0};
  double max{0.0};
};

// Per-region observed range for one metric.
using RegionMinMax = std::unordered_map<std::string, ValueRange>;

struct MetricMinMax {
  RegionMinMax synapses;
  RegionMinMax cells;
  ValueRange globalSynapses{0.0, 1.0};
  ValueRange globalCells{0.0, 1.0};

  const RegionMinMax& forMetric(Metric m) const {
    return m == Metric::SynapseDensity ? synapses : cells;
  }
  const ValueRange& globalFor(Metric m) const {
    return m == Metric::SynapseDensity ? globalSynapses : globalCells;
  }
};

// N+1 bucket boundaries in metric units, either for the whole dataset or
// per region. Regional boundaries win when both are present.
struct ColorThresholds {
  std::vector<double> all;
  std::unordered_map<std::string, std::vector<double>> byRegion;

  // Per-region boundaries over individual sublayer values, used for layer
  // colors. A region without an entry falls back to boundariesFor().
  std::unordered_map<std::string, std::vector<double>> layers;

  const std::vector<double>& boundariesFor(const std::string& region) const {
    auto it = byRegion.find(region);
    if (it != byRegion.end() && !it->second.empty()) return it->second;
    return all;
  }

  const std::vector<double>& layerBoundariesFor(const std::string& region) const {
    auto it = layers.find(region);
    if (it != layers.end() && !it->second.empty()) return it->second;
    return boundariesFor(region);
  }
};

struct MetricThresholds {
  ColorThresholds synapses;
  ColorThresholds cells;

  const ColorThresholds& forMetric(Metric m) const {
    return m == Metric::SynapseDensity ? synapses : cells;
  }
};

} // namespace em
