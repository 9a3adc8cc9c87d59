#pragma once
#include "em/data/ColumnTypes.hpp"

#include <string>
#include <vector>

namespace em {

struct ParseError {
  std::string code;     // e.g. "VALIDATION_BAD_COORDINATE"
  std::string message;  // human text
  std::string details;  // small JSON object naming the offending record/field
};

struct ParseResult {
  bool ok{true};
  ParseError err{};
  ColumnRecords records;
};

// Parse {"columns":[{entity, region, side, hex1, hex2, synapses, neurons,
// layers:[{index, synapses, neurons, value}]}]}. The first invalid record
// fails the whole document; nothing is coerced.
ParseResult readColumnRecords(const std::string& jsonText);

// Reads the whole file, then readColumnRecords().
ParseResult readColumnRecordsFile(const std::string& path);

ColumnRecords recordsForEntity(const ColumnRecords& records, const std::string& entity);

// Distinct entity names in first-seen order.
std::vector<std::string> entityNames(const ColumnRecords& records);

// Whole-file read helper shared with the config loader. Returns false if the
// file cannot be opened.
bool readTextFile(const std::string& path, std::string& out);

} // namespace em
