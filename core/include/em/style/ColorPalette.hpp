#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace em {

struct ColorPalette {
  std::string name;

  // Lightest to darkest; colors.size() buckets.
  std::vector<std::string> colors = {
    "#fee5d9",
    "#fcbba1",
    "#fc9272",
    "#ef6548",
    "#a50f15"
  };

  // colors.size() + 1 boundaries over the normalized range [0, 1].
  std::vector<double> thresholds = {0.0, 0.2, 0.4, 0.6, 0.8, 1.0};

  // Value exactly zero.
  std::string zeroValueColor = "#ffffff";

  // Column absent from the entity's region map.
  std::string notInRegionColor = "#999999";

  // Column exists in the region but the entity has nothing there. Same white
  // as zeroValueColor; only the stroke sets it apart.
  std::string existsNoDataColor = "#ffffff";
  std::string existsNoDataStroke = "#999999";
  double existsNoDataStrokeWidth{0.5};
};

// Sentinels used outside the value-based mapping.
struct StateColors {
  std::string notInRegion;
  std::string existsNoData;
  std::string existsNoDataStroke;
  std::string zeroValue;
};

// Built-in preset (5-step reds).
ColorPalette redPalette();

struct Rgb {
  std::uint8_t r{0}, g{0}, b{0};
};

// "#rrggbb" (or "rrggbb") to components. Returns false on malformed input.
bool parseHexColor(const std::string& hex, Rgb& out);

std::string toHexColor(const Rgb& c);

} // namespace em
