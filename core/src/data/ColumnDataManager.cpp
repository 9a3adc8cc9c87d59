#include "em/data/ColumnDataManager.hpp"

#include <algorithm>
#include <limits>

namespace em {

// -------------------- RegionColumnUniverse --------------------

const CoordinateSet& RegionColumnUniverse::columns(const std::string& region, Side side) const {
  static const CoordinateSet kEmpty;
  auto it = sets_.find(RegionSide{region, side});
  if (it == sets_.end()) return kEmpty;
  return it->second;
}

bool RegionColumnUniverse::contains(const std::string& region, Side side,
                                    const ColumnCoordinate& c) const {
  const auto& set = columns(region, side);
  return set.find(c) != set.end();
}

std::vector<ColumnCoordinate> RegionColumnUniverse::sortedColumns(const std::string& region,
                                                                  Side side) const {
  const auto& set = columns(region, side);
  std::vector<ColumnCoordinate> out(set.begin(), set.end());
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> RegionColumnUniverse::regions() const {
  std::vector<std::string> out;
  for (const auto& kv : sets_) {
    if (std::find(out.begin(), out.end(), kv.first.region) == out.end()) {
      out.push_back(kv.first.region);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Side> RegionColumnUniverse::sides() const {
  std::vector<Side> out;
  for (const auto& kv : sets_) {
    if (std::find(out.begin(), out.end(), kv.first.side) == out.end()) {
      out.push_back(kv.first.side);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::size_t RegionColumnUniverse::totalColumns() const {
  std::size_t n = 0;
  for (const auto& kv : sets_) n += kv.second.size();
  return n;
}

RegionColumnUniverse buildRegionUniverse(const ColumnRecords& allRecords) {
  RegionColumnUniverse u;
  if (allRecords.empty()) return u;

  int min1 = std::numeric_limits<int>::max();
  int min2 = std::numeric_limits<int>::max();

  for (const auto& rec : allRecords) {
    u.sets_[RegionSide{rec.region, rec.side}].insert(rec.coord);
    min1 = std::min(min1, rec.coord.hex1);
    min2 = std::min(min2, rec.coord.hex2);
  }

  u.minHex1_ = min1;
  u.minHex2_ = min2;
  return u;
}

// -------------------- EntityColumnMap --------------------

void EntityColumnMap::insert(const ColumnData& col) {
  RegionColumnKey key{col.region, col.coord};
  auto it = columns_.find(key);
  if (it == columns_.end()) {
    columns_.emplace(std::move(key), col);
    regionCounts_[col.region]++;
  } else {
    it->second = col;
  }
}

const ColumnData* EntityColumnMap::find(const std::string& region,
                                        const ColumnCoordinate& c) const {
  auto it = columns_.find(RegionColumnKey{region, c});
  if (it == columns_.end()) return nullptr;
  return &it->second;
}

std::size_t EntityColumnMap::countInRegion(const std::string& region) const {
  auto it = regionCounts_.find(region);
  return it == regionCounts_.end() ? 0 : it->second;
}

// -------------------- partitionBySide --------------------

bool sideForSelection(SideSelection sel, Side& out) {
  switch (sel) {
    case SideSelection::Left: out = Side::Left; return true;
    case SideSelection::Right: out = Side::Right; return true;
    case SideSelection::Middle: out = Side::Middle; return true;
    case SideSelection::Combined: return false;
  }
  return false;
}

SideDataMaps partitionBySide(const ColumnRecords& entityRecords, SideSelection target) {
  SideDataMaps maps;

  Side only;
  if (sideForSelection(target, only)) {
    auto& map = maps[only];
    for (const auto& rec : entityRecords) {
      if (rec.side == only) map.insert(rec);
    }
    return maps;
  }

  for (const auto& rec : entityRecords) {
    maps[rec.side].insert(rec);
  }
  return maps;
}

} // namespace em
