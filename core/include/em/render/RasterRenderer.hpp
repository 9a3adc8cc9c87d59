#pragma once
#include "em/render/SceneRenderer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace em {

// CPU rasterizer for PNG output. Draws the same descriptors and layout as the
// SVG path: white background, filled hexagons, a gray outline for
// ExistsNoData hexagons and the legend bins. Text is not rasterized.
// Largest canvas side in pixels, after scaling.
constexpr int kMaxRasterSide = 8192;

class RasterRenderer : public SceneRenderer {
public:
  explicit RasterRenderer(double scale = 1.0);

  // data:image/png;base64,..., or "" when the canvas would exceed kMaxRasterSide.
  std::string render(const Scene& scene) const override;
  OutputFormat format() const override { return OutputFormat::Png; }

  // RGBA, top-down rows. width/height receive the canvas size in pixels.
  // Oversized canvases yield an empty buffer and 0x0.
  std::vector<std::uint8_t> rasterize(const Scene& scene, int& width, int& height) const;

  double scale() const { return scale_; }

private:
  double scale_;
};

} // namespace em
