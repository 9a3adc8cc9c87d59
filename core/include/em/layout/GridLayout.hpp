#pragma once
#include "em/eyemap/HexagonDescriptor.hpp"
#include "em/geometry/HexGeometry.hpp"

#include <vector>

namespace em {

struct GridLayoutConfig {
  double hexSize{6.0};        // circumradius of one drawn hexagon
  double margin{10.0};
  double titleHeight{30.0};
  double legendWidth{12.0};
  double legendHeight{60.0};
  double legendGap{10.0};     // between grid and legend bar
  double legendLabelWidth{40.0};
  int legendBins{5};
};

struct GridBounds {
  double minX{0.0}, maxX{0.0};
  double minY{0.0}, maxY{0.0};

  double width() const { return maxX - minX; }
  double height() const { return maxY - minY; }
};

// Canvas placement for one grid panel. All values are in the canvas frame:
// origin top-left, y down.
struct GridLayout {
  double width{0.0};
  double height{0.0};

  // Added to a grid pixel coordinate to get its canvas position.
  double offsetX{0.0};
  double offsetY{0.0};

  double gridX{0.0}, gridY{0.0};
  double gridWidth{0.0}, gridHeight{0.0};

  double legendX{0.0}, legendY{0.0};
  double legendWidth{0.0}, legendHeight{0.0};
  int legendBins{0};
  bool legendOnLeft{false};  // mirrored grids put the legend on the outer side

  double titleX{0.0};
  double titleY{0.0};
  double subtitleY{0.0};
};

// Bounding box of hexagon centres padded by the hexagon radius.
// Empty input gives an all-zero box.
GridBounds computeGridBounds(const std::vector<PixelCoordinate>& centres, double hexSize);

GridLayout computeGridLayout(const GridBounds& bounds, const GridLayoutConfig& cfg,
                             Side mirrorSide);

// Computes the layout from the descriptors' grid positions, then translates
// every descriptor into the canvas frame. Renderers do no further math.
GridLayout layoutHexagons(HexagonList& hexes, const GridLayoutConfig& cfg, Side mirrorSide);

} // namespace em
