#include "em/render/SvgRenderer.hpp"
#include "em/geometry/HexGeometry.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstddef>
#include <string>

namespace em {

std::string xmlEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 16);
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

std::string jsonString(const std::string& s) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  writer.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
  return sb.GetString();
}

std::string jsonStringArray(const std::vector<std::string>& items) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  writer.StartArray();
  for (const auto& item : items) {
    writer.String(item.c_str(), static_cast<rapidjson::SizeType>(item.size()));
  }
  writer.EndArray();
  return sb.GetString();
}

namespace {

void appendAttr(std::string& out, const char* name, const std::string& value) {
  out += ' ';
  out += name;
  out += "=\"";
  out += xmlEscape(value);
  out += '"';
}

std::string legendLabel(double v) {
  return std::to_string(static_cast<long long>(std::llround(v)));
}

void appendHexagon(std::string& out, const HexagonDescriptor& h,
                   const std::string& points, int precision) {
  out += "<g class=\"hex\"";
  appendAttr(out, "data-hex1", std::to_string(h.coord.hex1));
  appendAttr(out, "data-hex2", std::to_string(h.coord.hex2));
  appendAttr(out, "data-region", h.region);
  appendAttr(out, "data-side", toTag(h.side));
  appendAttr(out, "data-status", toString(h.state));
  appendAttr(out, "data-value", formatFixed(h.value, precision));
  appendAttr(out, "data-base-title", jsonString(h.tooltip));
  appendAttr(out, "data-layer-colors", jsonStringArray(h.layerColors));
  appendAttr(out, "data-tooltip-layers", jsonStringArray(h.layerTooltips));
  out += ">";

  out += "<title>" + xmlEscape(h.tooltip) + "</title>";

  out += "<polygon";
  appendAttr(out, "points", points);
  appendAttr(out, "transform",
             "translate(" + formatFixed(h.x, precision) + "," + formatFixed(h.y, precision) + ")");
  appendAttr(out, "fill", h.fill);
  if (!h.stroke.empty()) {
    appendAttr(out, "stroke", h.stroke);
    appendAttr(out, "stroke-width", formatFixed(h.strokeWidth, precision));
  } else {
    appendAttr(out, "stroke", "none");
  }
  out += "/></g>\n";
}

void appendLegend(std::string& out, const Scene& scene) {
  const GridLayout& l = scene.layout;
  const std::size_t n = scene.legendColors.size();
  if (n == 0) return;

  const int p = scene.precision;
  const std::string gradId = "legend-gradient-" + scene.id;

  // Hard stops: each bucket is a flat band, lightest at the bottom.
  out += "<defs><linearGradient id=\"" + xmlEscape(gradId) +
         "\" x1=\"0\" y1=\"1\" x2=\"0\" y2=\"0\">";
  for (std::size_t i = 0; i < n; i++) {
    std::string lo = formatFixed(static_cast<double>(i) / static_cast<double>(n), 4);
    std::string hi = formatFixed(static_cast<double>(i + 1) / static_cast<double>(n), 4);
    out += "<stop offset=\"" + lo + "\" stop-color=\"" + xmlEscape(scene.legendColors[i]) + "\"/>";
    out += "<stop offset=\"" + hi + "\" stop-color=\"" + xmlEscape(scene.legendColors[i]) + "\"/>";
  }
  out += "</linearGradient></defs>\n";

  out += "<g class=\"legend\">";
  out += "<rect x=\"" + formatFixed(l.legendX, p) + "\" y=\"" + formatFixed(l.legendY, p) +
         "\" width=\"" + formatFixed(l.legendWidth, p) + "\" height=\"" +
         formatFixed(l.legendHeight, p) + "\" fill=\"url(#" + xmlEscape(gradId) +
         ")\" stroke=\"#999999\" stroke-width=\"0.5\"/>";

  if (!scene.legendTitle.empty()) {
    out += "<text class=\"legend-title\" x=\"" + formatFixed(l.legendX + l.legendWidth * 0.5, p) +
           "\" y=\"" + formatFixed(l.legendY - 4.0, p) +
           "\" text-anchor=\"middle\" font-size=\"8\">" + xmlEscape(scene.legendTitle) + "</text>";
  }

  const double binH = l.legendHeight / static_cast<double>(n);
  const double labelX = l.legendOnLeft ? l.legendX - 3.0 : l.legendX + l.legendWidth + 3.0;
  const char* anchor = l.legendOnLeft ? "end" : "start";
  for (std::size_t i = 0; i < scene.legendValues.size() && i <= n; i++) {
    double y = l.legendY + l.legendHeight - static_cast<double>(i) * binH;
    out += "<text class=\"legend-label\" x=\"" + formatFixed(labelX, p) + "\" y=\"" +
           formatFixed(y + 3.0, p) + "\" text-anchor=\"" + anchor + "\" font-size=\"7\">" +
           legendLabel(scene.legendValues[i]) + "</text>";
  }
  out += "</g>\n";
}

} // namespace

std::string SvgRenderer::render(const Scene& scene) const {
  const GridLayout& l = scene.layout;
  const int p = scene.precision;
  const std::string w = formatFixed(l.width, p);
  const std::string h = formatFixed(l.height, p);

  std::string out;
  out.reserve(512 + scene.hexes.size() * 512);

  out += "<svg xmlns=\"http://www.w3.org/2000/svg\" class=\"eyemap\" width=\"" + w +
         "\" height=\"" + h + "\" viewBox=\"0 0 " + w + " " + h + "\">\n";
  out += "<rect width=\"100%\" height=\"100%\" fill=\"#ffffff\"/>\n";

  if (!scene.title.empty()) {
    out += "<text class=\"eyemap-title\" x=\"" + formatFixed(l.titleX, p) + "\" y=\"" +
           formatFixed(l.titleY, p) +
           "\" text-anchor=\"middle\" font-size=\"12\" font-weight=\"bold\">" +
           xmlEscape(scene.title) + "</text>\n";
  }
  if (!scene.subtitle.empty()) {
    out += "<text class=\"eyemap-subtitle\" x=\"" + formatFixed(l.titleX, p) + "\" y=\"" +
           formatFixed(l.subtitleY, p) + "\" text-anchor=\"middle\" font-size=\"10\">" +
           xmlEscape(scene.subtitle) + "</text>\n";
  }

  const std::string points = hexagonPath(scene.hexSize, p);
  out += "<g class=\"hexagons\">\n";
  for (const auto& hex : scene.hexes) {
    appendHexagon(out, hex, points, p);
  }
  out += "</g>\n";

  if (hasDataHexagons(scene.hexes)) appendLegend(out, scene);

  out += "</svg>\n";
  return out;
}

} // namespace em
