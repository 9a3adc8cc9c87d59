#pragma once
#include "em/data/ColumnDataManager.hpp"
#include "em/eyemap/HexagonDescriptor.hpp"
#include "em/style/ColorMapper.hpp"
#include "em/style/ColorScale.hpp"

#include <cstdint>
#include <string>

namespace em {

enum class Normalization : std::uint8_t {
  Regional,   // per-region min/max, palette thresholds on [0, 1]
  Thresholds  // precomputed boundaries in metric units
};

inline const char* toString(Normalization n) {
  return n == Normalization::Regional ? "regional" : "thresholds";
}

struct ProcessRequest {
  std::string region;
  Side side{Side::Right};
  Metric metric{Metric::SynapseDensity};

  Normalization normalization{Normalization::Regional};
  const RegionMinMax* minMax{nullptr};        // Regional; null behaves as an empty table
  const ColorThresholds* thresholds{nullptr}; // Thresholds; null behaves as no boundaries

  double hexSize{6.0};
  double spacingFactor{1.1};
};

// Classifies and colors every column of universe[region, side] for one entity.
//
// Per coordinate c, with `entity` holding the entity's records for `side`:
//   value(c) > 0                         -> HasData
//   record at c with value 0             -> ExistsNoData
//   no record at c, none in the region   -> ExistsNoData
//   no record at c, others in the region -> NotInRegion
//
// HasData therefore always means a strictly positive value. Output is ordered
// by (hex1, hex2) and has exactly universe.columns(region, side).size()
// entries; positions are grid pixel coordinates (see layoutHexagons()).
HexagonList processRegion(const RegionColumnUniverse& universe,
                          const EntityColumnMap& entity,
                          const ProcessRequest& req,
                          const ColorMapper& mapper);

ColumnState classifyColumn(const EntityColumnMap& entity, const std::string& region,
                           const ColumnCoordinate& c, Metric metric);

// "Synapse count" / "Cell count".
const char* metricLabel(Metric m);

std::string notInRegionTooltip(const ColumnCoordinate& c, const std::string& region, Side side);
std::string noDataTooltip(const ColumnCoordinate& c, const std::string& region, Side side,
                          Metric m);
std::string hasDataTooltip(const ColumnCoordinate& c, const std::string& region, Side side,
                           Metric m, double value);
std::string layerTooltip(const std::string& region, int layerIndex, double value);

} // namespace em
