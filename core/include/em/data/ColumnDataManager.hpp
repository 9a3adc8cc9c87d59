#pragma once
#include "em/data/ColumnTypes.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace em {

using CoordinateSet = std::unordered_set<ColumnCoordinate, ColumnCoordinateHash>;

struct RegionSide {
  std::string region;
  Side side{Side::Right};

  bool operator==(const RegionSide& o) const {
    return side == o.side && region == o.region;
  }
};

struct RegionSideHash {
  std::size_t operator()(const RegionSide& k) const {
    return std::hash<std::string>{}(k.region) * 31u + static_cast<std::size_t>(k.side);
  }
};

// For every (region, side), the union of coordinates observed for any entity
// in the dataset snapshot. Built once by buildRegionUniverse() and read-only
// afterwards, so concurrent render calls may share one instance.
class RegionColumnUniverse {
public:
  // Empty set when the (region, side) pair was never observed.
  const CoordinateSet& columns(const std::string& region, Side side) const;

  bool contains(const std::string& region, Side side, const ColumnCoordinate& c) const;

  // columns() sorted by (hex1, hex2) for deterministic output order.
  std::vector<ColumnCoordinate> sortedColumns(const std::string& region, Side side) const;

  std::vector<std::string> regions() const;
  std::vector<Side> sides() const;

  bool empty() const { return sets_.empty(); }
  std::size_t totalColumns() const;

  // Smallest indices over the whole snapshot; the origin for hexToAxial() so
  // every region's grid shares one frame.
  int minHex1() const { return minHex1_; }
  int minHex2() const { return minHex2_; }

private:
  friend RegionColumnUniverse buildRegionUniverse(const ColumnRecords& allRecords);

  std::unordered_map<RegionSide, CoordinateSet, RegionSideHash> sets_;
  int minHex1_{0};
  int minHex2_{0};
};

// Scan every record of every entity and accumulate per-(region, side) unions.
RegionColumnUniverse buildRegionUniverse(const ColumnRecords& allRecords);

struct RegionColumnKey {
  std::string region;
  ColumnCoordinate coord;

  bool operator==(const RegionColumnKey& o) const {
    return coord == o.coord && region == o.region;
  }
};

struct RegionColumnKeyHash {
  std::size_t operator()(const RegionColumnKey& k) const {
    return std::hash<std::string>{}(k.region) ^ (ColumnCoordinateHash{}(k.coord) << 1);
  }
};

// One entity's columns for one side, keyed by (region, hex1, hex2).
class EntityColumnMap {
public:
  // A second record for the same key replaces the first.
  void insert(const ColumnData& col);

  const ColumnData* find(const std::string& region, const ColumnCoordinate& c) const;
  std::size_t countInRegion(const std::string& region) const;
  std::size_t size() const { return columns_.size(); }
  bool empty() const { return columns_.empty(); }

private:
  std::unordered_map<RegionColumnKey, ColumnData, RegionColumnKeyHash> columns_;
  std::unordered_map<std::string, std::size_t> regionCounts_;
};

using SideDataMaps = std::map<Side, EntityColumnMap>;

// Group one entity's records by side. A specific side always yields exactly
// that side's entry (possibly empty); Combined yields one entry per side tag
// present in the records.
SideDataMaps partitionBySide(const ColumnRecords& entityRecords, SideSelection target);

// Side a specific selection refers to; Combined has none.
bool sideForSelection(SideSelection sel, Side& out);

} // namespace em
