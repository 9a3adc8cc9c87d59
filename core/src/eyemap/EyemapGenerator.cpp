#include "em/eyemap/EyemapGenerator.hpp"
#include "em/export/ImageExport.hpp"
#include "em/layout/GridLayout.hpp"

#include <cstdio>
#include <utility>

namespace em {

namespace {

const Metric kMetrics[] = {Metric::SynapseDensity, Metric::CellCount};

std::string legendTitleFor(Metric m) {
  return m == Metric::SynapseDensity ? "Total Synapses" : "Cell Count";
}

std::string sanitizeFilePart(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '(' || c == ')') continue;
    out.push_back(c == ' ' ? '_' : c);
  }
  return out;
}

std::string joinPath(const std::string& dir, const std::string& rel) {
  if (dir.empty()) return rel;
  if (dir.back() == '/') return dir + rel;
  return dir + "/" + rel;
}

} // namespace

std::string gridTitle(const std::string& region, Metric metric) {
  return region + (metric == Metric::SynapseDensity ? " Synapses (All Columns)"
                                                    : " Cell Count (All Columns)");
}

std::string gridSubtitle(const std::string& entity, Side side) {
  return entity + " (" + toTag(side) + ")";
}

std::string gridKey(const std::string& region, Side side) {
  return region + "_" + toTag(side);
}

std::string gridFileName(const std::string& entity, const std::string& region, Side side,
                         Metric metric, const char* ext) {
  return sanitizeFilePart(entity) + "_" + sanitizeFilePart(region) + "_" + toString(side) +
         "_" + toString(metric) + "." + ext;
}

EyemapGenerator::EyemapGenerator(EyemapConfig cfg, ColorMapper mapper)
  : cfg_(std::move(cfg)),
    mapper_(std::move(mapper)),
    renderer_(makeSceneRenderer(cfg_.outputFormat, cfg_.pngScale)) {}

std::vector<double> EyemapGenerator::legendValuesFor(const EyemapRequest& req,
                                                     const std::string& region,
                                                     Metric metric) const {
  if (cfg_.normalization == Normalization::Thresholds) {
    if (!req.thresholds) return mapper_.legendValues(0.0, 0.0);
    const auto& b = req.thresholds->forMetric(metric).boundariesFor(region);
    if (b.size() == mapper_.palette().colors.size() + 1) return b;
    if (b.size() >= 2) return mapper_.legendValues(b.front(), b.back());
    return mapper_.legendValues(0.0, 0.0);
  }

  ValueRange range{0.0, 0.0};
  if (req.minMax) {
    const auto& table = req.minMax->forMetric(metric);
    auto it = table.find(region);
    if (it != table.end()) range = it->second;
  }
  return mapper_.legendValues(range.min, range.max);
}

Scene EyemapGenerator::buildScene(const EyemapRequest& req, const EntityColumnMap& entity,
                                  const std::string& region, Side side, Metric metric) const {
  Scene scene;
  scene.id = sanitizeFilePart(gridKey(region, side)) + "_" + toString(metric);
  scene.hexSize = cfg_.hexSize;
  scene.precision = cfg_.precision;
  if (!req.universe) return scene;

  ProcessRequest pr;
  pr.region = region;
  pr.side = side;
  pr.metric = metric;
  pr.normalization = cfg_.normalization;
  pr.minMax = req.minMax ? &req.minMax->forMetric(metric) : nullptr;
  pr.thresholds = req.thresholds ? &req.thresholds->forMetric(metric) : nullptr;
  pr.hexSize = cfg_.hexSize;
  pr.spacingFactor = cfg_.spacingFactor;

  scene.hexes = processRegion(*req.universe, entity, pr, mapper_);
  if (scene.hexes.empty()) return scene;

  scene.layout = layoutHexagons(scene.hexes, gridLayoutConfig(cfg_), side);
  scene.title = gridTitle(region, metric);
  scene.subtitle = gridSubtitle(req.entity, side);
  scene.legendTitle = legendTitleFor(metric);
  scene.legendColors = mapper_.palette().colors;
  scene.legendValues = legendValuesFor(req, region, metric);
  return scene;
}

EyemapResult EyemapGenerator::generate(const EyemapRequest& req) const {
  EyemapResult result;

  if (!req.universe || req.universe->empty()) {
    result.ok = false;
    result.error = "No columns provided";
    return result;
  }
  if (!renderer_) {
    result.ok = false;
    result.error = "No renderer for output format";
    return result;
  }

  static const ColumnRecords kNoRecords;
  SideDataMaps bySide = partitionBySide(req.entityRecords ? *req.entityRecords : kNoRecords,
                                        req.side);

  std::vector<Side> sides;
  Side only;
  if (sideForSelection(req.side, only)) {
    sides.push_back(only);
  } else {
    sides = req.universe->sides();
  }

  static const EntityColumnMap kNoData;

  for (const auto& region : cfg_.regionOrder) {
    for (Side side : sides) {
      if (req.universe->columns(region, side).empty()) continue;

      auto it = bySide.find(side);
      const EntityColumnMap& entity = (it != bySide.end()) ? it->second : kNoData;
      const std::string key = gridKey(region, side);

      for (Metric metric : kMetrics) {
        Scene scene = buildScene(req, entity, region, side, metric);
        std::string content = renderer_->render(scene);
        if (content.empty()) {
          std::fprintf(stderr, "EyemapGenerator: cannot render %s %s\n", key.c_str(),
                       toString(metric));
          result.ok = false;
          result.error = "Failed to render " + key + " " + toString(metric);
          return result;
        }

        if (cfg_.saveToFiles) {
          std::string rel = std::string("eyemaps/") +
                            gridFileName(req.entity, region, side, metric,
                                         renderer_->fileExtension());
          std::string path = joinPath(cfg_.outputDir, rel);

          bool written;
          if (renderer_->format() == OutputFormat::Png) {
            std::vector<std::uint8_t> bytes;
            written = decodePngDataUrl(content, bytes) && writeBinaryFile(path, bytes);
          } else {
            written = writeTextFile(path, content);
          }
          if (!written) {
            std::fprintf(stderr, "EyemapGenerator: failed to write %s\n", path.c_str());
            result.ok = false;
            result.error = "Failed to write " + path;
            return result;
          }
          content = rel;
        }

        result.grids[key][toString(metric)] = std::move(content);
        result.panelCount++;
      }
    }
  }

  return result;
}

} // namespace em
