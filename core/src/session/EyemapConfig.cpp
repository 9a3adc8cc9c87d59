#include "em/session/EyemapConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace em {

GridLayoutConfig gridLayoutConfig(const EyemapConfig& cfg) {
  GridLayoutConfig g;
  g.hexSize = cfg.hexSize;
  g.margin = cfg.margin;
  g.titleHeight = cfg.titleHeight;
  g.legendWidth = cfg.legendWidth;
  g.legendHeight = cfg.legendHeight;
  return g;
}

bool parseOutputFormat(const std::string& name, OutputFormat& out) {
  if (name == "svg") { out = OutputFormat::Svg; return true; }
  if (name == "png") { out = OutputFormat::Png; return true; }
  return false;
}

bool parseNormalization(const std::string& name, Normalization& out) {
  if (name == "regional") { out = Normalization::Regional; return true; }
  if (name == "thresholds") { out = Normalization::Thresholds; return true; }
  return false;
}

std::string serializeEyemapConfig(const EyemapConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("hexSize", cfg.hexSize, alloc);
  doc.AddMember("spacingFactor", cfg.spacingFactor, alloc);
  doc.AddMember("margin", cfg.margin, alloc);
  doc.AddMember("precision", cfg.precision, alloc);
  doc.AddMember("outputFormat",
                rapidjson::Value(toString(cfg.outputFormat), alloc), alloc);
  doc.AddMember("normalization",
                rapidjson::Value(toString(cfg.normalization), alloc), alloc);
  doc.AddMember("saveToFiles", cfg.saveToFiles, alloc);
  doc.AddMember("outputDir",
                rapidjson::Value(cfg.outputDir.c_str(), alloc), alloc);

  rapidjson::Value regions(rapidjson::kArrayType);
  for (const auto& r : cfg.regionOrder) {
    regions.PushBack(rapidjson::Value(r.c_str(), alloc), alloc);
  }
  doc.AddMember("regionOrder", regions, alloc);

  doc.AddMember("pngScale", cfg.pngScale, alloc);

  rapidjson::Value legend(rapidjson::kObjectType);
  legend.AddMember("width", cfg.legendWidth, alloc);
  legend.AddMember("height", cfg.legendHeight, alloc);
  doc.AddMember("legend", legend, alloc);

  doc.AddMember("titleHeight", cfg.titleHeight, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

namespace {

bool setError(std::string* error, const std::string& msg) {
  if (error) *error = msg;
  return false;
}

// Missing -> true, value unchanged.
bool readNumber(const rapidjson::Value& obj, const char* key, double& out, std::string* error) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsNumber()) return setError(error, std::string(key) + " must be a number");
  out = obj[key].GetDouble();
  return true;
}

} // namespace

bool deserializeEyemapConfig(const std::string& json, EyemapConfig& out, std::string* error) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return setError(error, "invalid JSON object");

  EyemapConfig cfg = out;

  if (!readNumber(doc, "hexSize", cfg.hexSize, error)) return false;
  if (cfg.hexSize < 1.0 || cfg.hexSize > 50.0)
    return setError(error, "hexSize must be within [1, 50]");

  if (!readNumber(doc, "spacingFactor", cfg.spacingFactor, error)) return false;
  if (cfg.spacingFactor < 1.0 || cfg.spacingFactor > 3.0)
    return setError(error, "spacingFactor must be within [1.0, 3.0]");

  if (!readNumber(doc, "margin", cfg.margin, error)) return false;
  if (cfg.margin < 0.0) return setError(error, "margin must not be negative");

  if (doc.HasMember("precision")) {
    if (!doc["precision"].IsInt()) return setError(error, "precision must be an integer");
    cfg.precision = doc["precision"].GetInt();
    if (cfg.precision < 0) return setError(error, "precision must not be negative");
  }

  if (doc.HasMember("outputFormat")) {
    const auto& v = doc["outputFormat"];
    if (!v.IsString() || !parseOutputFormat(v.GetString(), cfg.outputFormat))
      return setError(error, "outputFormat must be \"svg\" or \"png\"");
  }

  if (doc.HasMember("normalization")) {
    const auto& v = doc["normalization"];
    if (!v.IsString() || !parseNormalization(v.GetString(), cfg.normalization))
      return setError(error, "normalization must be \"regional\" or \"thresholds\"");
  }

  if (doc.HasMember("saveToFiles")) {
    if (!doc["saveToFiles"].IsBool()) return setError(error, "saveToFiles must be a boolean");
    cfg.saveToFiles = doc["saveToFiles"].GetBool();
  }

  if (doc.HasMember("outputDir")) {
    if (!doc["outputDir"].IsString()) return setError(error, "outputDir must be a string");
    cfg.outputDir = doc["outputDir"].GetString();
  }

  if (doc.HasMember("regionOrder")) {
    const auto& arr = doc["regionOrder"];
    if (!arr.IsArray()) return setError(error, "regionOrder must be an array");
    cfg.regionOrder.clear();
    for (rapidjson::SizeType i = 0; i < arr.Size(); i++) {
      if (!arr[i].IsString()) return setError(error, "regionOrder entries must be strings");
      cfg.regionOrder.push_back(arr[i].GetString());
    }
  }

  if (!readNumber(doc, "pngScale", cfg.pngScale, error)) return false;
  if (cfg.pngScale <= 0.0) return setError(error, "pngScale must be positive");

  if (doc.HasMember("legend")) {
    const auto& lg = doc["legend"];
    if (!lg.IsObject()) return setError(error, "legend must be an object");
    if (!readNumber(lg, "width", cfg.legendWidth, error)) return false;
    if (!readNumber(lg, "height", cfg.legendHeight, error)) return false;
  }

  if (!readNumber(doc, "titleHeight", cfg.titleHeight, error)) return false;

  out = cfg;
  return true;
}

} // namespace em
