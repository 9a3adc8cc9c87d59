#include "em/data/RecordReader.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdio>
#include <string>

namespace em {

namespace {

ParseResult fail(const std::string& code, const std::string& message,
                 const std::string& detailsJson = "{}") {
  ParseResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

std::string fieldDetails(std::size_t index, const char* field) {
  return std::string(R"({"index":)") + std::to_string(index) +
         R"(,"field":")" + field + R"("})";
}

std::string pathDetails(const std::string& path) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("path");
  w.String(path.c_str(), static_cast<rapidjson::SizeType>(path.size()));
  w.EndObject();
  return sb.GetString();
}

const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

// Missing -> def. Present but not a non-negative number -> false.
bool readCount(const rapidjson::Value& obj, const char* key, double def, double& out) {
  const auto* v = getMember(obj, key);
  if (!v) { out = def; return true; }
  if (!v->IsNumber()) return false;
  out = v->GetDouble();
  return out >= 0.0;
}

// JSON integers only: 27 is accepted, 27.0 and "27" are not.
bool readInt(const rapidjson::Value& obj, const char* key, int& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsInt()) return false;
  out = v->GetInt();
  return true;
}

} // namespace

ParseResult readColumnRecords(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("PARSE_ERROR", "RecordReader: invalid JSON object");
  }

  const auto* cols = getMember(d, "columns");
  if (!cols || !cols->IsArray()) {
    return fail("VALIDATION_MISSING_FIELD", "Missing array field: columns",
                R"({"field":"columns"})");
  }

  ParseResult result;
  result.records.reserve(cols->Size());

  for (rapidjson::SizeType i = 0; i < cols->Size(); i++) {
    const auto& c = (*cols)[i];
    if (!c.IsObject()) {
      return fail("PARSE_ERROR", "Column record is not an object", fieldDetails(i, ""));
    }

    ColumnData col;

    const auto* ent = getMember(c, "entity");
    if (ent) {
      if (!ent->IsString()) {
        return fail("VALIDATION_MISSING_FIELD", "entity must be a string", fieldDetails(i, "entity"));
      }
      col.entity = ent->GetString();
    }

    const auto* reg = getMember(c, "region");
    if (!reg || !reg->IsString() || reg->GetStringLength() == 0) {
      return fail("VALIDATION_MISSING_FIELD", "region must be a non-empty string",
                  fieldDetails(i, "region"));
    }
    col.region = reg->GetString();

    const auto* side = getMember(c, "side");
    if (!side || !side->IsString()) {
      return fail("VALIDATION_BAD_SIDE", "side must be a string", fieldDetails(i, "side"));
    }
    if (!trySideFromTag(side->GetString(), col.side)) {
      return fail("VALIDATION_BAD_SIDE",
                  std::string("Unknown side tag: ") + side->GetString(),
                  fieldDetails(i, "side"));
    }

    if (!readInt(c, "hex1", col.coord.hex1)) {
      return fail("VALIDATION_BAD_COORDINATE", "hex1 must be an integer", fieldDetails(i, "hex1"));
    }
    if (!readInt(c, "hex2", col.coord.hex2)) {
      return fail("VALIDATION_BAD_COORDINATE", "hex2 must be an integer", fieldDetails(i, "hex2"));
    }

    if (!readCount(c, "synapses", 0.0, col.totalSynapses)) {
      return fail("VALIDATION_NEGATIVE_COUNT", "synapses must be a non-negative number",
                  fieldDetails(i, "synapses"));
    }
    if (!readCount(c, "neurons", 0.0, col.totalNeurons)) {
      return fail("VALIDATION_NEGATIVE_COUNT", "neurons must be a non-negative number",
                  fieldDetails(i, "neurons"));
    }

    const auto* layers = getMember(c, "layers");
    if (layers) {
      if (!layers->IsArray()) {
        return fail("VALIDATION_BAD_LAYER", "layers must be an array", fieldDetails(i, "layers"));
      }
      col.layers.reserve(layers->Size());
      for (rapidjson::SizeType k = 0; k < layers->Size(); k++) {
        const auto& l = (*layers)[k];
        LayerMetric lm;
        if (!l.IsObject() || !readInt(l, "index", lm.index) ||
            lm.index != static_cast<int>(k) + 1) {
          return fail("VALIDATION_BAD_LAYER",
                      "layer index must be 1-based, contiguous and ordered",
                      fieldDetails(i, "layers"));
        }
        if (!readCount(l, "synapses", 0.0, lm.synapseCount) ||
            !readCount(l, "neurons", 0.0, lm.neuronCount)) {
          return fail("VALIDATION_NEGATIVE_COUNT", "layer counts must be non-negative numbers",
                      fieldDetails(i, "layers"));
        }
        const auto* val = getMember(l, "value");
        if (val && !val->IsNumber()) {
          return fail("VALIDATION_BAD_LAYER", "layer value must be a number",
                      fieldDetails(i, "layers"));
        }
        lm.value = val ? val->GetDouble() : lm.synapseCount;
        col.layers.push_back(lm);
      }
    }

    result.records.push_back(std::move(col));
  }

  return result;
}

bool readTextFile(const std::string& path, std::string& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  out.clear();
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
    out.append(buf, n);
  }
  std::fclose(f);
  return true;
}

ParseResult readColumnRecordsFile(const std::string& path) {
  std::string text;
  if (!readTextFile(path, text)) {
    std::fprintf(stderr, "RecordReader: cannot open %s\n", path.c_str());
    return fail("IO_ERROR", "Cannot open file",
                pathDetails(path));
  }
  return readColumnRecords(text);
}

ColumnRecords recordsForEntity(const ColumnRecords& records, const std::string& entity) {
  ColumnRecords out;
  for (const auto& r : records) {
    if (r.entity == entity) out.push_back(r);
  }
  return out;
}

std::vector<std::string> entityNames(const ColumnRecords& records) {
  std::vector<std::string> out;
  for (const auto& r : records) {
    if (std::find(out.begin(), out.end(), r.entity) == out.end()) out.push_back(r.entity);
  }
  return out;
}

} // namespace em
