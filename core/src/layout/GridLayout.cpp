#include "em/layout/GridLayout.hpp"

#include <algorithm>

namespace em {

GridBounds computeGridBounds(const std::vector<PixelCoordinate>& centres, double hexSize) {
  GridBounds b;
  if (centres.empty()) return b;

  b.minX = b.maxX = centres.front().x;
  b.minY = b.maxY = centres.front().y;
  for (const auto& p : centres) {
    b.minX = std::min(b.minX, p.x);
    b.maxX = std::max(b.maxX, p.x);
    b.minY = std::min(b.minY, p.y);
    b.maxY = std::max(b.maxY, p.y);
  }

  b.minX -= hexSize;
  b.maxX += hexSize;
  b.minY -= hexSize;
  b.maxY += hexSize;
  return b;
}

GridLayout computeGridLayout(const GridBounds& bounds, const GridLayoutConfig& cfg,
                             Side mirrorSide) {
  GridLayout l;
  l.gridWidth = bounds.width();
  l.gridHeight = bounds.height();
  l.legendWidth = cfg.legendWidth;
  l.legendHeight = cfg.legendHeight;
  l.legendBins = cfg.legendBins;
  l.legendOnLeft = (mirrorSide == Side::Left);

  double legendBand = cfg.legendGap + cfg.legendWidth + cfg.legendLabelWidth;
  double contentH = std::max(l.gridHeight, cfg.legendHeight);

  l.width = l.gridWidth + legendBand + 2.0 * cfg.margin;
  l.height = cfg.titleHeight + contentH + 2.0 * cfg.margin;

  l.gridY = cfg.margin + cfg.titleHeight;
  if (l.legendOnLeft) {
    // [margin][labels][bar][gap][grid][margin]
    l.legendX = cfg.margin + cfg.legendLabelWidth;
    l.gridX = l.legendX + cfg.legendWidth + cfg.legendGap;
  } else {
    // [margin][grid][gap][bar][labels][margin]
    l.gridX = cfg.margin;
    l.legendX = l.gridX + l.gridWidth + cfg.legendGap;
  }

  // Legend sits at the bottom of the content band.
  l.legendY = l.gridY + contentH - cfg.legendHeight;

  l.offsetX = l.gridX - bounds.minX;
  l.offsetY = l.gridY - bounds.minY;

  l.titleX = l.width * 0.5;
  l.titleY = cfg.margin + cfg.titleHeight * 0.45;
  l.subtitleY = cfg.margin + cfg.titleHeight * 0.9;
  return l;
}

GridLayout layoutHexagons(HexagonList& hexes, const GridLayoutConfig& cfg, Side mirrorSide) {
  std::vector<PixelCoordinate> centres;
  centres.reserve(hexes.size());
  for (const auto& h : hexes) centres.push_back(PixelCoordinate{h.x, h.y});

  GridLayout l = computeGridLayout(computeGridBounds(centres, cfg.hexSize), cfg, mirrorSide);

  for (auto& h : hexes) {
    h.x += l.offsetX;
    h.y += l.offsetY;
  }
  return l;
}

} // namespace em
