#include "em/render/SceneRenderer.hpp"
#include "em/render/RasterRenderer.hpp"
#include "em/render/SvgRenderer.hpp"

namespace em {

bool hasDataHexagons(const HexagonList& hexes) {
  for (const auto& h : hexes) {
    if (h.state == ColumnState::HasData) return true;
  }
  return false;
}

std::unique_ptr<SceneRenderer> makeSceneRenderer(OutputFormat fmt, double pngScale) {
  switch (fmt) {
    case OutputFormat::Svg: return std::make_unique<SvgRenderer>();
    case OutputFormat::Png: return std::make_unique<RasterRenderer>(pngScale);
  }
  return nullptr;
}

} // namespace em
