#include "em/data/ColumnTypes.hpp"

#include <cctype>
#include <string>

namespace em {

static std::string lowerCopy(const std::string& s) {
  std::string out = s;
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool trySideFromTag(const std::string& tag, Side& out) {
  if (tag == "L") { out = Side::Left; return true; }
  if (tag == "R") { out = Side::Right; return true; }
  if (tag == "M") { out = Side::Middle; return true; }

  const std::string lower = lowerCopy(tag);
  if (lower == "left") { out = Side::Left; return true; }
  if (lower == "right") { out = Side::Right; return true; }
  if (lower == "middle") { out = Side::Middle; return true; }
  return false;
}

Side parseSide(const std::string& tag) {
  Side s;
  if (!trySideFromTag(tag, s)) {
    throw std::runtime_error("Unknown side tag: '" + tag + "'");
  }
  return s;
}

SideSelection parseSideSelection(const std::string& tag) {
  const std::string lower = lowerCopy(tag);
  if (lower == "combined" || lower == "both") return SideSelection::Combined;

  switch (parseSide(tag)) {
    case Side::Left: return SideSelection::Left;
    case Side::Right: return SideSelection::Right;
    case Side::Middle: return SideSelection::Middle;
  }
  throw std::runtime_error("Unknown side selection: '" + tag + "'");
}

Metric parseMetric(const std::string& name) {
  if (name == "synapse_density") return Metric::SynapseDensity;
  if (name == "cell_count") return Metric::CellCount;
  throw std::runtime_error("Unknown metric: '" + name + "'");
}

} // namespace em
