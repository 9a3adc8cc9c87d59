#pragma once
#include "em/eyemap/HexagonDescriptor.hpp"
#include "em/layout/GridLayout.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace em {

enum class OutputFormat : std::uint8_t {
  Svg,
  Png
};

inline const char* toString(OutputFormat f) {
  return f == OutputFormat::Svg ? "svg" : "png";
}

// Everything a renderer needs for one grid panel. Hexagon positions are
// already in the canvas frame (see layoutHexagons()).
struct Scene {
  std::string id;            // unique per panel; used for SVG element ids
  HexagonList hexes;
  GridLayout layout;

  double hexSize{6.0};
  int precision{2};

  std::string title;
  std::string subtitle;

  std::string legendTitle;
  std::vector<std::string> legendColors;  // lightest first
  std::vector<double> legendValues;       // legendColors.size() + 1 boundaries
};

bool hasDataHexagons(const HexagonList& hexes);

// Serializes a Scene into one output format. Implementations hold no
// per-call state, so one instance may render scenes from several threads.
class SceneRenderer {
public:
  virtual ~SceneRenderer() = default;

  // SVG markup, or a data:image/png;base64 URL for raster output. An empty
  // string means the scene could not be rendered.
  virtual std::string render(const Scene& scene) const = 0;

  virtual OutputFormat format() const = 0;

  // "svg" / "png"
  const char* fileExtension() const { return toString(format()); }
};

// pngScale is ignored for SVG.
std::unique_ptr<SceneRenderer> makeSceneRenderer(OutputFormat fmt, double pngScale = 1.0);

} // namespace em
