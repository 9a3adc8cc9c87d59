// Eyemap demo: reads column records (or uses a small built-in dataset),
// computes the dataset-wide universe and statistics, and renders every
// region/side/metric panel for one entity.
//
//   eyemap_demo [records.json] [--entity NAME] [--side L|R|M|combined]
//               [--config config.json] [--out DIR] [--format svg|png]

#include "em/data/ColumnDataManager.hpp"
#include "em/data/MetricStats.hpp"
#include "em/data/RecordReader.hpp"
#include "em/eyemap/EyemapGenerator.hpp"
#include "em/session/EyemapConfig.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

static const char* kSampleRecords = R"({"columns":[
  {"entity":"Tm3","region":"ME","side":"R","hex1":27,"hex2":11,"synapses":400,"neurons":3,
   "layers":[{"index":1,"synapses":250,"neurons":2},{"index":2,"synapses":150,"neurons":1}]},
  {"entity":"Tm3","region":"ME","side":"R","hex1":28,"hex2":12,"synapses":120,"neurons":1,
   "layers":[{"index":1,"synapses":100,"neurons":1},{"index":2,"synapses":20,"neurons":0}]},
  {"entity":"Mi1","region":"ME","side":"R","hex1":26,"hex2":10,"synapses":90,"neurons":1},
  {"entity":"Mi1","region":"ME","side":"R","hex1":27,"hex2":12,"synapses":60,"neurons":1},
  {"entity":"Mi1","region":"LO","side":"R","hex1":27,"hex2":11,"synapses":35,"neurons":1},
  {"entity":"Mi1","region":"LO","side":"R","hex1":26,"hex2":10,"synapses":15,"neurons":1},
  {"entity":"Tm3","region":"ME","side":"L","hex1":27,"hex2":11,"synapses":310,"neurons":2},
  {"entity":"Mi1","region":"ME","side":"L","hex1":26,"hex2":11,"synapses":45,"neurons":1}
]})";

int main(int argc, char* argv[]) {
  std::string recordsPath;
  std::string entity = "Tm3";
  std::string sideArg = "combined";
  std::string configPath;
  std::string outDir;
  std::string formatArg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--entity" && i + 1 < argc) entity = argv[++i];
    else if (a == "--side" && i + 1 < argc) sideArg = argv[++i];
    else if (a == "--config" && i + 1 < argc) configPath = argv[++i];
    else if (a == "--out" && i + 1 < argc) outDir = argv[++i];
    else if (a == "--format" && i + 1 < argc) formatArg = argv[++i];
    else recordsPath = a;
  }

  em::EyemapConfig cfg;
  if (!configPath.empty()) {
    std::string text, err;
    if (!em::readTextFile(configPath, text)) {
      std::fprintf(stderr, "eyemap_demo: cannot read %s\n", configPath.c_str());
      return 1;
    }
    if (!em::deserializeEyemapConfig(text, cfg, &err)) {
      std::fprintf(stderr, "eyemap_demo: bad config: %s\n", err.c_str());
      return 1;
    }
  }
  if (!formatArg.empty() && !em::parseOutputFormat(formatArg, cfg.outputFormat)) {
    std::fprintf(stderr, "eyemap_demo: unknown format %s\n", formatArg.c_str());
    return 1;
  }
  if (!outDir.empty()) {
    cfg.saveToFiles = true;
    cfg.outputDir = outDir;
  }

  em::ParseResult parsed = recordsPath.empty()
      ? em::readColumnRecords(kSampleRecords)
      : em::readColumnRecordsFile(recordsPath);
  if (!parsed.ok) {
    std::fprintf(stderr, "eyemap_demo: %s: %s %s\n", parsed.err.code.c_str(),
                 parsed.err.message.c_str(), parsed.err.details.c_str());
    return 1;
  }

  em::SideSelection side;
  try {
    side = em::parseSideSelection(sideArg);
  } catch (const std::runtime_error& e) {
    std::fprintf(stderr, "eyemap_demo: %s\n", e.what());
    return 1;
  }

  // Dataset-wide inputs, built once and shared by every panel.
  em::RegionColumnUniverse universe = em::buildRegionUniverse(parsed.records);
  em::MetricMinMax minMax = em::computeMetricMinMax(parsed.records);
  em::MetricThresholds thresholds;
  thresholds.synapses = em::computeColorThresholds(parsed.records, em::Metric::SynapseDensity);
  thresholds.cells = em::computeColorThresholds(parsed.records, em::Metric::CellCount);

  em::ColumnRecords entityRecords = em::recordsForEntity(parsed.records, entity);
  std::printf("Records: %zu total, %zu for %s; universe %zu columns\n",
              parsed.records.size(), entityRecords.size(), entity.c_str(),
              universe.totalColumns());

  em::EyemapRequest req;
  req.entity = entity;
  req.side = side;
  req.universe = &universe;
  req.entityRecords = &entityRecords;
  req.minMax = &minMax;
  req.thresholds = &thresholds;

  em::EyemapGenerator gen(cfg);
  em::EyemapResult result = gen.generate(req);
  if (!result.ok) {
    std::fprintf(stderr, "eyemap_demo: %s\n", result.error.c_str());
    return 1;
  }

  for (const auto& grid : result.grids) {
    for (const auto& metric : grid.second) {
      if (cfg.saveToFiles) {
        std::printf("  %s / %s -> %s\n", grid.first.c_str(), metric.first.c_str(),
                    metric.second.c_str());
      } else {
        std::printf("  %s / %s: %zu bytes\n", grid.first.c_str(), metric.first.c_str(),
                    metric.second.size());
      }
    }
  }
  std::printf("Rendered %zu panels (%s)\n", result.panelCount, em::toString(cfg.outputFormat));
  return 0;
}
