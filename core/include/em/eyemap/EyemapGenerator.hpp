#pragma once
#include "em/data/ColumnDataManager.hpp"
#include "em/eyemap/DataProcessor.hpp"
#include "em/render/SceneRenderer.hpp"
#include "em/session/EyemapConfig.hpp"
#include "em/style/ColorMapper.hpp"
#include "em/style/ColorScale.hpp"

#include <map>
#include <memory>
#include <string>

namespace em {

struct EyemapRequest {
  std::string entity;
  SideSelection side{SideSelection::Combined};

  // Not owned; must outlive generate(). Only universe and entityRecords are
  // required. Null tables behave as empty ones.
  const RegionColumnUniverse* universe{nullptr};
  const ColumnRecords* entityRecords{nullptr};
  const MetricMinMax* minMax{nullptr};
  const MetricThresholds* thresholds{nullptr};
};

// grids["ME_R"]["synapse_density"] -> SVG markup, PNG data URL, or with
// saveToFiles the path "eyemaps/<file>" relative to outputDir.
using EyemapGrids = std::map<std::string, std::map<std::string, std::string>>;

struct EyemapResult {
  bool ok{true};
  std::string error;
  EyemapGrids grids;
  std::size_t panelCount{0};
};

// Runs DataProcessor, layout and the configured renderer for every region in
// cfg.regionOrder, every requested side and both metrics. Const after
// construction; concurrent generate() calls are safe when they write to
// different files.
class EyemapGenerator {
public:
  explicit EyemapGenerator(EyemapConfig cfg = EyemapConfig{}, ColorMapper mapper = ColorMapper{});

  EyemapResult generate(const EyemapRequest& req) const;

  // One panel. Returns a Scene with no hexagons when universe[region, side]
  // is empty.
  Scene buildScene(const EyemapRequest& req, const EntityColumnMap& entity,
                   const std::string& region, Side side, Metric metric) const;

  const EyemapConfig& config() const { return cfg_; }
  const ColorMapper& mapper() const { return mapper_; }

private:
  std::vector<double> legendValuesFor(const EyemapRequest& req, const std::string& region,
                                      Metric metric) const;

  EyemapConfig cfg_;
  ColorMapper mapper_;
  std::unique_ptr<SceneRenderer> renderer_;
};

// "<region> Synapses (All Columns)" / "<region> Cell Count (All Columns)"
std::string gridTitle(const std::string& region, Metric metric);

// "<entity> (<side tag>)"
std::string gridSubtitle(const std::string& entity, Side side);

// "<region>_<side tag>"
std::string gridKey(const std::string& region, Side side);

// <entity>_<region>_<side>_<metric>.<ext> with spaces turned into '_' and
// parentheses dropped.
std::string gridFileName(const std::string& entity, const std::string& region, Side side,
                         Metric metric, const char* ext);

} // namespace em
