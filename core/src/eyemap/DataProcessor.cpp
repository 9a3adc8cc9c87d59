#include "em/eyemap/DataProcessor.hpp"
#include "em/geometry/HexGeometry.hpp"

#include <cmath>
#include <string>

namespace em {

namespace {

std::string intText(double v) {
  return std::to_string(static_cast<long long>(std::llround(v)));
}

std::string columnLine(const ColumnCoordinate& c) {
  return "Column: " + std::to_string(c.hex1) + ", " + std::to_string(c.hex2);
}

std::string roiText(const std::string& region, Side side) {
  return region + " (" + toTag(side) + ")";
}

std::string colorFor(double value, const ProcessRequest& req, const ColorMapper& mapper) {
  if (req.normalization == Normalization::Thresholds) {
    static const ColorThresholds kNone;
    return mapper.colorForThresholds(value, req.region, req.thresholds ? *req.thresholds : kNone);
  }
  static const RegionMinMax kEmpty;
  return mapper.colorForRegionalValue(value, req.region, req.minMax ? *req.minMax : kEmpty);
}

std::string layerColorFor(double value, const ProcessRequest& req, const ColorMapper& mapper) {
  if (req.normalization == Normalization::Thresholds) {
    static const ColorThresholds kNone;
    return mapper.colorForLayerThresholds(value, req.region,
                                          req.thresholds ? *req.thresholds : kNone);
  }
  return colorFor(value, req, mapper);
}

} // namespace

const char* metricLabel(Metric m) {
  return m == Metric::SynapseDensity ? "Synapse count" : "Cell count";
}

std::string notInRegionTooltip(const ColumnCoordinate& c, const std::string& region, Side side) {
  return columnLine(c) + "\nColumn not identified in " + roiText(region, side);
}

std::string noDataTooltip(const ColumnCoordinate& c, const std::string& region, Side side,
                          Metric m) {
  return columnLine(c) + "\n" + metricLabel(m) + ": 0\nROI: " + roiText(region, side) +
         "\nNo data for current entity";
}

std::string hasDataTooltip(const ColumnCoordinate& c, const std::string& region, Side side,
                           Metric m, double value) {
  return columnLine(c) + "\n" + metricLabel(m) + ": " + intText(value) +
         "\nROI: " + roiText(region, side);
}

std::string layerTooltip(const std::string& region, int layerIndex, double value) {
  return intText(value) + "\nROI: " + region + std::to_string(layerIndex);
}

ColumnState classifyColumn(const EntityColumnMap& entity, const std::string& region,
                           const ColumnCoordinate& c, Metric metric) {
  const ColumnData* col = entity.find(region, c);
  if (col) {
    return col->metricValue(metric) > 0.0 ? ColumnState::HasData : ColumnState::ExistsNoData;
  }
  return entity.countInRegion(region) == 0 ? ColumnState::ExistsNoData
                                           : ColumnState::NotInRegion;
}

HexagonList processRegion(const RegionColumnUniverse& universe,
                          const EntityColumnMap& entity,
                          const ProcessRequest& req,
                          const ColorMapper& mapper) {
  HexagonList out;
  std::vector<ColumnCoordinate> coords = universe.sortedColumns(req.region, req.side);
  if (coords.empty()) return out;

  const double size = effectiveHexSize(req.hexSize, req.spacingFactor);
  const StateColors states = mapper.stateColors();
  const double noDataStrokeWidth = mapper.palette().existsNoDataStrokeWidth;

  out.reserve(coords.size());
  for (const auto& c : coords) {
    HexagonDescriptor h;
    h.coord = c;
    h.region = req.region;
    h.side = req.side;
    h.state = classifyColumn(entity, req.region, c, req.metric);

    PixelCoordinate p = hexToPixel(c.hex1, c.hex2, universe.minHex1(), universe.minHex2(),
                                   size, req.side);
    h.x = p.x;
    h.y = p.y;

    switch (h.state) {
      case ColumnState::NotInRegion:
        h.fill = states.notInRegion;
        h.tooltip = notInRegionTooltip(c, req.region, req.side);
        break;

      case ColumnState::ExistsNoData:
        h.fill = states.existsNoData;
        h.stroke = states.existsNoDataStroke;
        h.strokeWidth = noDataStrokeWidth;
        h.tooltip = noDataTooltip(c, req.region, req.side, req.metric);
        break;

      case ColumnState::HasData: {
        const ColumnData* col = entity.find(req.region, c);
        h.value = col->metricValue(req.metric);
        h.fill = colorFor(h.value, req, mapper);
        h.tooltip = hasDataTooltip(c, req.region, req.side, req.metric, h.value);

        h.layerColors.reserve(col->layers.size());
        h.layerTooltips.reserve(col->layers.size());
        for (const auto& layer : col->layers) {
          double lv = layer.metricValue(req.metric);
          h.layerColors.push_back(layerColorFor(lv, req, mapper));
          h.layerTooltips.push_back(layerTooltip(req.region, layer.index, lv));
        }
        break;
      }
    }

    out.push_back(std::move(h));
  }
  return out;
}

} // namespace em
