#include "em/render/RasterRenderer.hpp"
#include "em/export/ImageExport.hpp"
#include "em/style/ColorPalette.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace em {

namespace {

constexpr double kSqrt3 = 1.7320508075688772;

struct Canvas {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;

  void fill(const Rgb& c) {
    for (std::size_t i = 0; i < rgba.size(); i += 4) {
      rgba[i + 0] = c.r;
      rgba[i + 1] = c.g;
      rgba[i + 2] = c.b;
      rgba[i + 3] = 255;
    }
  }

  void set(int x, int y, const Rgb& c) {
    if (x < 0 || y < 0 || x >= width || y >= height) return;
    std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                       static_cast<std::size_t>(x)) * 4;
    rgba[idx + 0] = c.r;
    rgba[idx + 1] = c.g;
    rgba[idx + 2] = c.b;
    rgba[idx + 3] = 255;
  }
};

// Flat-top hexagon of circumradius r centred on (cx, cy).
bool insideHexagon(double px, double py, double cx, double cy, double r) {
  if (r <= 0.0) return false;
  double dx = std::fabs(px - cx);
  double dy = std::fabs(py - cy);
  if (dy > r * kSqrt3 * 0.5) return false;
  return kSqrt3 * dx + dy <= kSqrt3 * r;
}

Rgb colorOr(const std::string& hex, const Rgb& fallback) {
  Rgb c;
  return parseHexColor(hex, c) ? c : fallback;
}

void fillRect(Canvas& cv, double x0, double y0, double x1, double y1, const Rgb& c) {
  int ix0 = static_cast<int>(std::floor(x0));
  int iy0 = static_cast<int>(std::floor(y0));
  int ix1 = static_cast<int>(std::ceil(x1));
  int iy1 = static_cast<int>(std::ceil(y1));
  for (int y = iy0; y < iy1; y++)
    for (int x = ix0; x < ix1; x++) cv.set(x, y, c);
}

void drawHexagon(Canvas& cv, const HexagonDescriptor& h, double radius, double scale) {
  const Rgb white{255, 255, 255};
  const double cx = h.x * scale;
  const double cy = h.y * scale;
  const double r = radius * scale;

  const Rgb fill = colorOr(h.fill, white);
  const bool outlined = !h.stroke.empty();
  const Rgb stroke = colorOr(h.stroke, Rgb{153, 153, 153});
  const double inner = r - std::max(1.0, h.strokeWidth * scale);

  int x0 = static_cast<int>(std::floor(cx - r));
  int x1 = static_cast<int>(std::ceil(cx + r));
  int y0 = static_cast<int>(std::floor(cy - r));
  int y1 = static_cast<int>(std::ceil(cy + r));

  // Sample pixel centres.
  for (int y = y0; y <= y1; y++) {
    for (int x = x0; x <= x1; x++) {
      double px = x + 0.5;
      double py = y + 0.5;
      if (!insideHexagon(px, py, cx, cy, r)) continue;
      if (outlined && !insideHexagon(px, py, cx, cy, inner)) {
        cv.set(x, y, stroke);
      } else {
        cv.set(x, y, fill);
      }
    }
  }
}

void drawLegend(Canvas& cv, const Scene& scene, double scale) {
  const std::size_t n = scene.legendColors.size();
  if (n == 0) return;

  const GridLayout& l = scene.layout;
  const double binH = l.legendHeight / static_cast<double>(n);
  for (std::size_t i = 0; i < n; i++) {
    double top = l.legendY + l.legendHeight - static_cast<double>(i + 1) * binH;
    fillRect(cv, l.legendX * scale, top * scale,
             (l.legendX + l.legendWidth) * scale, (top + binH) * scale,
             colorOr(scene.legendColors[i], Rgb{255, 255, 255}));
  }
}

} // namespace

RasterRenderer::RasterRenderer(double scale)
  : scale_(scale > 0.0 ? scale : 1.0) {}

std::vector<std::uint8_t> RasterRenderer::rasterize(const Scene& scene,
                                                    int& width, int& height) const {
  width = 0;
  height = 0;

  const double w = std::ceil(scene.layout.width * scale_);
  const double h = std::ceil(scene.layout.height * scale_);
  if (!(w <= kMaxRasterSide && h <= kMaxRasterSide)) {
    std::fprintf(stderr, "RasterRenderer: canvas %.0fx%.0f exceeds %dx%d\n",
                 w, h, kMaxRasterSide, kMaxRasterSide);
    return {};
  }

  Canvas cv;
  cv.width = std::max(1, static_cast<int>(w));
  cv.height = std::max(1, static_cast<int>(h));
  cv.rgba.assign(static_cast<std::size_t>(cv.width) * static_cast<std::size_t>(cv.height) * 4, 0);
  cv.fill(Rgb{255, 255, 255});

  for (const auto& h : scene.hexes) {
    drawHexagon(cv, h, scene.hexSize, scale_);
  }
  if (hasDataHexagons(scene.hexes)) drawLegend(cv, scene, scale_);

  width = cv.width;
  height = cv.height;
  return std::move(cv.rgba);
}

std::string RasterRenderer::render(const Scene& scene) const {
  int w = 0, h = 0;
  auto pixels = rasterize(scene, w, h);
  if (pixels.empty()) return "";
  return pngDataUrl(encodePNG(pixels.data(), w, h));
}

} // namespace em
