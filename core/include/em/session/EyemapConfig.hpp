#pragma once
#include "em/eyemap/DataProcessor.hpp"
#include "em/layout/GridLayout.hpp"
#include "em/render/SceneRenderer.hpp"

#include <string>
#include <vector>

namespace em {

// Rendering options for one reporting run.
struct EyemapConfig {
  double hexSize{6.0};
  double spacingFactor{1.1};
  double margin{10.0};
  int precision{2};

  OutputFormat outputFormat{OutputFormat::Svg};
  Normalization normalization{Normalization::Regional};

  bool saveToFiles{false};
  std::string outputDir;

  std::vector<std::string> regionOrder{"ME", "LO", "LOP"};

  double pngScale{1.0};

  double legendWidth{12.0};
  double legendHeight{60.0};
  double titleHeight{30.0};
};

GridLayoutConfig gridLayoutConfig(const EyemapConfig& cfg);

std::string serializeEyemapConfig(const EyemapConfig& cfg);

// Members missing from `json` keep the values already in `out`; unknown members
// are ignored. Returns false (and leaves `out` untouched) on malformed JSON, a
// wrong member type or an out-of-range value; `error` receives the reason.
bool deserializeEyemapConfig(const std::string& json, EyemapConfig& out,
                             std::string* error = nullptr);

bool parseOutputFormat(const std::string& name, OutputFormat& out);
bool parseNormalization(const std::string& name, Normalization& out);

} // namespace em
