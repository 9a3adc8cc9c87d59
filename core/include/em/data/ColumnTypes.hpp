#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace em {

// A hexagonal column identified by its (hex1, hex2) index pair.
struct ColumnCoordinate {
  int hex1{0};
  int hex2{0};

  bool operator==(const ColumnCoordinate& o) const {
    return hex1 == o.hex1 && hex2 == o.hex2;
  }
  bool operator!=(const ColumnCoordinate& o) const { return !(*this == o); }
  bool operator<(const ColumnCoordinate& o) const {
    return hex1 != o.hex1 ? hex1 < o.hex1 : hex2 < o.hex2;
  }
};

struct ColumnCoordinateHash {
  std::size_t operator()(const ColumnCoordinate& c) const {
    std::uint64_t k = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.hex1)) << 32) |
                      static_cast<std::uint32_t>(c.hex2);
    return std::hash<std::uint64_t>{}(k);
  }
};

// Body side a record was observed on.
enum class Side : std::uint8_t {
  Left,
  Right,
  Middle
};

// Side requested by the caller; Combined renders every side present.
enum class SideSelection : std::uint8_t {
  Left,
  Right,
  Middle,
  Combined
};

enum class Metric : std::uint8_t {
  SynapseDensity,
  CellCount
};

// Single-letter tag used in data files and region/side keys ("L", "R", "M").
inline const char* toTag(Side s) {
  switch (s) {
    case Side::Left: return "L";
    case Side::Right: return "R";
    case Side::Middle: return "M";
  }
  return "?";
}

inline const char* toString(Side s) {
  switch (s) {
    case Side::Left: return "left";
    case Side::Right: return "right";
    case Side::Middle: return "middle";
  }
  return "unknown";
}

inline const char* toString(SideSelection s) {
  switch (s) {
    case SideSelection::Left: return "left";
    case SideSelection::Right: return "right";
    case SideSelection::Middle: return "middle";
    case SideSelection::Combined: return "combined";
  }
  return "unknown";
}

inline const char* toString(Metric m) {
  switch (m) {
    case Metric::SynapseDensity: return "synapse_density";
    case Metric::CellCount: return "cell_count";
  }
  return "unknown";
}

// Accepts "L"/"R"/"M" and "left"/"right"/"middle" (any case for the long form).
bool trySideFromTag(const std::string& tag, Side& out);

// Throws std::runtime_error on an unrecognized tag.
Side parseSide(const std::string& tag);

// Accepts the side forms plus "combined"/"both". Throws on anything else.
SideSelection parseSideSelection(const std::string& tag);

// Throws std::runtime_error unless name is "synapse_density" or "cell_count".
Metric parseMetric(const std::string& name);

// One sublayer's contribution to a column.
struct LayerMetric {
  int index{1};              // 1-based
  double synapseCount{0.0};
  double neuronCount{0.0};
  double value{0.0};         // coloring value for the synapse metric

  double metricValue(Metric m) const {
    return m == Metric::SynapseDensity ? value : neuronCount;
  }
};

// One entity's data for one (region, side, coordinate). Built once by the
// record reader and only passed around by const reference afterwards.
struct ColumnData {
  std::string entity;
  std::string region;
  Side side{Side::Right};
  ColumnCoordinate coord;
  double totalSynapses{0.0};
  double totalNeurons{0.0};
  std::vector<LayerMetric> layers;

  double metricValue(Metric m) const {
    return m == Metric::SynapseDensity ? totalSynapses : totalNeurons;
  }
};

using ColumnRecords = std::vector<ColumnData>;

} // namespace em
