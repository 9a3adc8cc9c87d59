// D3.3: Metric min/max and threshold computation test

#include "em/data/MetricStats.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static em::ColumnData col(const char* region, int h1, double syn, double cells) {
  em::ColumnData c;
  c.entity = "A";
  c.region = region;
  c.side = em::Side::Right;
  c.coord = {h1, 0};
  c.totalSynapses = syn;
  c.totalNeurons = cells;
  return c;
}

int main() {
  em::ColumnRecords recs = {
    col("ME", 1, 10, 1),
    col("ME", 2, 50, 2),
    col("ME", 3, 0, 0),
    col("LO", 1, 4, 3),
    col("LO", 2, 8, 0),
    col("LOP", 1, 0, 0),
  };

  // Min/max over strictly positive values
  {
    em::MetricMinMax mm = em::computeMetricMinMax(recs);
    requireTrue(near(mm.globalSynapses.min, 4) && near(mm.globalSynapses.max, 50), "global synapse range");
    requireTrue(near(mm.globalCells.min, 1) && near(mm.globalCells.max, 3), "global cell range");
    requireTrue(near(mm.synapses["ME"].min, 10) && near(mm.synapses["ME"].max, 50), "ME synapse range ignores zero");
    requireTrue(near(mm.synapses["LO"].min, 4) && near(mm.synapses["LO"].max, 8), "LO synapse range");
    requireTrue(near(mm.cells["LO"].min, 3) && near(mm.cells["LO"].max, 3), "LO cell range");
    requireTrue(near(mm.synapses["LOP"].min, 4) && near(mm.synapses["LOP"].max, 50),
                "all-zero region inherits global range");
    requireTrue(&mm.forMetric(em::Metric::CellCount) == &mm.cells, "forMetric(CellCount)");
    std::printf("  min/max PASS\n");
  }

  {
    em::MetricMinMax mm = em::computeMetricMinMax({col("ME", 1, 0, 0)});
    requireTrue(near(mm.globalSynapses.min, 0) && near(mm.globalSynapses.max, 1), "no positives -> [0,1]");
    requireTrue(near(mm.synapses["ME"].max, 1), "region inherits [0,1]");
    std::printf("  degenerate min/max PASS\n");
  }

  // Equal-width thresholds
  {
    em::ColorThresholds t = em::computeColorThresholds(recs, em::Metric::SynapseDensity, 4,
                                                       em::ThresholdMethod::Equal);
    requireTrue(t.all.size() == 5, "4 buckets -> 5 boundaries");
    requireTrue(near(t.all.front(), 4) && near(t.all.back(), 50), "equal spans positive min/max");
    requireTrue(near(t.all[2], 27), "equal midpoint");
    requireTrue(t.byRegion.count("ME") == 1 && t.byRegion.count("LO") == 1, "regional lists");
    requireTrue(t.byRegion.count("LOP") == 0, "region without positives has no list");
    requireTrue(&t.boundariesFor("LOP") == &t.all, "missing region falls back to global");
    std::printf("  equal PASS\n");
  }

  // Percentile thresholds
  {
    em::ColumnRecords five;
    for (int i = 1; i <= 5; i++) five.push_back(col("ME", i, i * 10.0, 1));
    em::ColorThresholds t = em::computeColorThresholds(five, em::Metric::SynapseDensity, 4);
    requireTrue(t.all.size() == 5, "percentile boundary count");
    requireTrue(near(t.all[0], 10) && near(t.all[1], 20) && near(t.all[2], 30) &&
                near(t.all[3], 40) && near(t.all[4], 50), "percentiles of 10..50");

    bool ordered = true;
    for (std::size_t i = 1; i < t.all.size(); i++) {
      if (t.all[i] < t.all[i - 1]) ordered = false;
    }
    requireTrue(ordered, "boundaries non-decreasing");
    std::printf("  percentile PASS\n");
  }

  {
    std::vector<double> s = {1, 2, 3, 4};
    requireTrue(near(em::percentileOfSorted(s, 50), 2.5), "median interpolates");
    requireTrue(near(em::percentileOfSorted(s, 0), 1) && near(em::percentileOfSorted(s, 100), 4),
                "percentile ends");
    requireTrue(near(em::percentileOfSorted({7}, 30), 7), "single value");
    requireTrue(near(em::percentileOfSorted({}, 50), 0), "empty input -> 0");
  }

  // Sublayer boundaries
  {
    em::ColumnData a = col("ME", 1, 100, 3);
    a.layers = {em::LayerMetric{1, 10, 1, 10}, em::LayerMetric{2, 0, 0, 0},
                em::LayerMetric{3, 50, 2, 50}};
    em::ColumnData b = col("LO", 2, 80, 1);
    em::ColorThresholds t = em::computeColorThresholds({a, b}, em::Metric::SynapseDensity, 4,
                                                       em::ThresholdMethod::Equal);
    requireTrue(t.layers.count("ME") == 1 && t.layers.count("LO") == 0,
                "layer lists only where positive layer values exist");
    const auto& me = t.layers.at("ME");
    requireTrue(me.size() == 5 && near(me.front(), 10) && near(me.back(), 50),
                "layer boundaries span positive layer values, zero layers skipped");
    requireTrue(&t.layerBoundariesFor("ME") == &me, "layer lookup");
    requireTrue(&t.layerBoundariesFor("LO") == &t.boundariesFor("LO"),
                "region without layers falls back to column boundaries");

    em::ColorThresholds cells = em::computeColorThresholds({a}, em::Metric::CellCount, 4,
                                                           em::ThresholdMethod::Equal);
    requireTrue(near(cells.layers.at("ME").front(), 1) && near(cells.layers.at("ME").back(), 2),
                "cell metric uses layer neuron counts");
    std::printf("  layers PASS\n");
  }

  {
    em::ColorThresholds t = em::computeColorThresholds({}, em::Metric::CellCount);
    requireTrue(t.all.empty() && t.byRegion.empty() && t.layers.empty(), "empty input -> empty thresholds");
    std::printf("  empty PASS\n");
  }

  std::printf("D3.3 metric_stats: ALL PASS\n");
  return 0;
}
