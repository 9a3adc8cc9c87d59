#pragma once
#include "em/data/ColumnTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace em {

// Existence state of one column for the entity being rendered.
enum class ColumnState : std::uint8_t {
  HasData,
  ExistsNoData,
  NotInRegion
};

// Values written to the data-status attribute.
inline const char* toString(ColumnState s) {
  switch (s) {
    case ColumnState::HasData: return "has_data";
    case ColumnState::ExistsNoData: return "no_data";
    case ColumnState::NotInRegion: return "not_in_region";
  }
  return "unknown";
}

// Render-ready unit. x/y start in grid pixel space and are moved into the
// canvas frame by computeGridLayout().
struct HexagonDescriptor {
  ColumnCoordinate coord;
  std::string region;
  Side side{Side::Right};
  ColumnState state{ColumnState::NotInRegion};

  double x{0.0};
  double y{0.0};

  double value{0.0};
  std::string fill;
  std::string stroke;       // empty = no outline
  double strokeWidth{0.0};

  std::string tooltip;

  // Parallel, same length as the column's layers (HasData only).
  std::vector<std::string> layerColors;
  std::vector<std::string> layerTooltips;
};

using HexagonList = std::vector<HexagonDescriptor>;

} // namespace em
