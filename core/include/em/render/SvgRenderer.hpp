#pragma once
#include "em/render/SceneRenderer.hpp"

#include <string>
#include <vector>

namespace em {

// One <g class="hex"> per descriptor with the client tooltip attributes
// (data-layer-colors / data-tooltip-layers as index-aligned JSON arrays),
// followed by the title text and a stepped legend.
class SvgRenderer : public SceneRenderer {
public:
  std::string render(const Scene& scene) const override;
  OutputFormat format() const override { return OutputFormat::Svg; }
};

std::string xmlEscape(const std::string& s);

// JSON encodings used inside attributes (not yet XML-escaped).
std::string jsonString(const std::string& s);
std::string jsonStringArray(const std::vector<std::string>& items);

} // namespace em
