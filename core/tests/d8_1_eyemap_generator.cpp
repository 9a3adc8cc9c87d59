// D8.1: EyemapGenerator end-to-end: grids, sides, output modes

#include "em/data/ColumnDataManager.hpp"
#include "em/data/MetricStats.hpp"
#include "em/data/RecordReader.hpp"
#include "em/eyemap/EyemapGenerator.hpp"
#include "em/export/ImageExport.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

static int tests = 0;
static int passed = 0;

static void check(bool cond, const char* msg) {
  tests++;
  if (!cond) {
    std::fprintf(stderr, "FAIL: %s\n", msg);
    std::exit(1);
  }
  passed++;
  std::printf("  OK: %s\n", msg);
}

static em::ColumnData col(const char* entity, const char* region, em::Side side,
                          int h1, int h2, double syn, double cells) {
  em::ColumnData c;
  c.entity = entity;
  c.region = region;
  c.side = side;
  c.coord = {h1, h2};
  c.totalSynapses = syn;
  c.totalNeurons = cells;
  return c;
}

int main() {
  const em::ColumnRecords all = {
    col("Tm3", "ME", em::Side::Right, 27, 11, 400, 3),
    col("Tm3", "ME", em::Side::Right, 28, 12, 120, 1),
    col("Mi1", "ME", em::Side::Right, 26, 10, 90, 1),
    col("Mi1", "LO", em::Side::Right, 27, 11, 35, 1),
    col("Mi1", "LO", em::Side::Right, 26, 10, 15, 1),
    col("Tm3", "ME", em::Side::Left, 27, 11, 310, 2),
  };

  const em::RegionColumnUniverse universe = em::buildRegionUniverse(all);
  const em::MetricMinMax minMax = em::computeMetricMinMax(all);
  em::MetricThresholds thresholds;
  thresholds.synapses = em::computeColorThresholds(all, em::Metric::SynapseDensity);
  thresholds.cells = em::computeColorThresholds(all, em::Metric::CellCount);
  const em::ColumnRecords tm3 = em::recordsForEntity(all, "Tm3");

  em::EyemapRequest req;
  req.entity = "Tm3";
  req.universe = &universe;
  req.entityRecords = &tm3;
  req.minMax = &minMax;
  req.thresholds = &thresholds;

  // Naming helpers
  {
    check(em::gridTitle("ME", em::Metric::SynapseDensity) == "ME Synapses (All Columns)",
          "synapse title");
    check(em::gridTitle("LO", em::Metric::CellCount) == "LO Cell Count (All Columns)",
          "cell title");
    check(em::gridSubtitle("Tm3", em::Side::Left) == "Tm3 (L)", "subtitle carries side tag");
    check(em::gridKey("ME", em::Side::Right) == "ME_R", "grid key");
    check(em::gridFileName("Tm3 (a)", "ME", em::Side::Right, em::Metric::SynapseDensity, "svg") ==
              "Tm3_a_ME_right_synapse_density.svg", "file name is sanitized");
  }

  // Combined: every side in the universe, regions with no columns omitted
  {
    em::EyemapGenerator gen;
    em::EyemapResult r = gen.generate(req);
    check(r.ok, "combined generate succeeds");
    check(r.grids.size() == 3, "ME_L, ME_R and LO_R only");
    check(r.grids.count("ME_L") && r.grids.count("ME_R") && r.grids.count("LO_R"),
          "grid keys");
    check(!r.grids.count("LO_L") && !r.grids.count("LOP_R"), "empty regions omitted");
    check(r.panelCount == 6, "two metrics per grid");

    const std::string& svg = r.grids["ME_R"]["synapse_density"];
    check(svg.compare(0, 4, "<svg") == 0, "inline SVG markup");
    check(svg.find("ME Synapses (All Columns)") != std::string::npos, "title in panel");
    check(svg.find("Tm3 (R)") != std::string::npos, "subtitle in panel");
    check(svg.find("class=\"legend\"") != std::string::npos, "legend with data");
    check(r.grids["ME_R"]["cell_count"].find("ME Cell Count (All Columns)") != std::string::npos,
          "cell panel title");

    // Tm3 has nothing in LO: every hexagon is white with a border and no legend is drawn.
    const std::string& lo = r.grids["LO_R"]["synapse_density"];
    check(lo.find("data-status=\"has_data\"") == std::string::npos, "LO has no HAS_DATA");
    check(lo.find("data-status=\"no_data\"") != std::string::npos, "LO is EXISTS_NO_DATA");
    check(lo.find("class=\"legend\"") == std::string::npos, "no legend without data");
  }

  // A specific side renders only that side
  {
    em::EyemapRequest right = req;
    right.side = em::SideSelection::Right;
    em::EyemapGenerator gen;
    em::EyemapResult r = gen.generate(right);
    check(r.ok && r.grids.size() == 2, "right side -> ME_R and LO_R");
    check(!r.grids.count("ME_L"), "left side not rendered");
  }

  // Region order from the config
  {
    em::EyemapConfig cfg;
    cfg.regionOrder = {"LO"};
    em::EyemapGenerator gen(cfg);
    em::EyemapResult r = gen.generate(req);
    check(r.ok && r.grids.size() == 1 && r.grids.count("LO_R"), "only configured regions");
  }

  // Threshold normalization
  {
    em::EyemapConfig cfg;
    cfg.normalization = em::Normalization::Thresholds;
    em::EyemapGenerator gen(cfg);
    em::EyemapResult r = gen.generate(req);
    check(r.ok && r.panelCount == 6, "threshold normalization renders every panel");
  }

  // No universe
  {
    em::EyemapGenerator gen;
    em::EyemapRequest bare = req;
    bare.universe = nullptr;
    em::EyemapResult r = gen.generate(bare);
    check(!r.ok && r.error == "No columns provided", "missing universe rejected");

    const em::RegionColumnUniverse none;
    bare.universe = &none;
    r = gen.generate(bare);
    check(!r.ok && r.error == "No columns provided", "empty universe rejected");
    check(r.grids.empty(), "no partial grids on failure");
  }

  // Entity without records still gets its grids
  {
    const em::ColumnRecords nothing;
    em::EyemapRequest ghost = req;
    ghost.entity = "Unknown";
    ghost.entityRecords = &nothing;
    em::EyemapGenerator gen;
    em::EyemapResult r = gen.generate(ghost);
    check(r.ok && r.grids.size() == 3, "unknown entity -> same grid keys");
    check(r.grids["ME_R"]["synapse_density"].find("data-status=\"has_data\"") ==
              std::string::npos, "unknown entity has no HAS_DATA");
  }

  // PNG output
  {
    em::EyemapConfig cfg;
    cfg.outputFormat = em::OutputFormat::Png;
    em::EyemapGenerator gen(cfg);
    em::EyemapResult r = gen.generate(req);
    check(r.ok, "png generate succeeds");
    const std::string& url = r.grids["ME_R"]["synapse_density"];
    check(url.compare(0, std::strlen(em::kPngDataUrlPrefix), em::kPngDataUrlPrefix) == 0,
          "png panels are data URLs");
    std::vector<std::uint8_t> bytes;
    check(em::decodePngDataUrl(url, bytes) && bytes.size() > 8 && bytes[1] == 'P',
          "data URL holds a PNG");
  }

  // A universe too wide to rasterize fails the request
  {
    const em::ColumnRecords sparse = {
      col("Tm3", "ME", em::Side::Right, 0, 0, 10, 1),
      col("Tm3", "ME", em::Side::Right, 100000, 0, 20, 1),
    };
    const em::RegionColumnUniverse wide = em::buildRegionUniverse(sparse);
    em::EyemapRequest wreq;
    wreq.entity = "Tm3";
    wreq.side = em::SideSelection::Right;
    wreq.universe = &wide;
    wreq.entityRecords = &sparse;

    em::EyemapConfig cfg;
    cfg.outputFormat = em::OutputFormat::Png;
    em::EyemapResult r = em::EyemapGenerator(cfg).generate(wreq);
    check(!r.ok && r.error == "Failed to render ME_R synapse_density",
          "oversized PNG panel reported in the result");

    r = em::EyemapGenerator().generate(wreq);
    check(r.ok && r.panelCount == 2, "same universe renders as SVG");
  }

  // Saving to files returns relative paths
  {
    namespace fs = std::filesystem;
    const std::string dir = "d8_1_test_out";
    fs::remove_all(dir);

    em::EyemapConfig cfg;
    cfg.saveToFiles = true;
    cfg.outputDir = dir;
    em::EyemapGenerator gen(cfg);
    em::EyemapResult r = gen.generate(req);
    check(r.ok, "file output succeeds");
    check(r.grids["ME_R"]["synapse_density"] == "eyemaps/Tm3_ME_right_synapse_density.svg",
          "grid value is the relative path");
    check(fs::exists(dir + "/eyemaps/Tm3_ME_right_synapse_density.svg"), "SVG file written");
    check(fs::exists(dir + "/eyemaps/Tm3_ME_left_cell_count.svg"), "left panel written");

    cfg.outputFormat = em::OutputFormat::Png;
    em::EyemapGenerator png(cfg);
    r = png.generate(req);
    check(r.ok && r.grids["LO_R"]["cell_count"] == "eyemaps/Tm3_LO_right_cell_count.png",
          "png relative path");
    const std::string pngPath = dir + "/eyemaps/Tm3_LO_right_cell_count.png";
    check(fs::exists(pngPath) && fs::file_size(pngPath) > 8, "PNG file written");

    fs::remove_all(dir);
  }

  // Single panel
  {
    em::EyemapGenerator gen;
    em::SideDataMaps maps = em::partitionBySide(tm3, em::SideSelection::Right);
    em::Scene s = gen.buildScene(req, maps[em::Side::Right], "ME", em::Side::Right,
                                 em::Metric::SynapseDensity);
    check(s.id == "ME_R_synapse_density", "scene id");
    check(s.hexes.size() == 3, "scene covers the region universe");
    check(s.legendTitle == "Total Synapses", "legend title");
    check(s.legendValues.size() == s.legendColors.size() + 1, "legend boundaries");
    check(s.layout.width > 0.0 && s.layout.height > 0.0, "scene laid out");

    em::Scene empty = gen.buildScene(req, maps[em::Side::Right], "LOP", em::Side::Right,
                                     em::Metric::CellCount);
    check(empty.hexes.empty(), "region without columns -> empty scene");
  }

  std::printf("D8.1 eyemap_generator: %d/%d PASS\n", passed, tests);
  return 0;
}
