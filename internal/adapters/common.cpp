#include "internal/adapters/common.hpp"

#include <algorithm>
#include <cmath>

namespace aoef::adapters {

std::string IdToString(std::uint32_t id) {
  return std::to_string(id);
}

std::string IdToString(const util::UUID& id) {
  return util::ToString(id);
}

std::string Describe(std::string_view kind, const std::string& uuid) {
  return std::string(kind) + " " + uuid;
}

util::UUID ParseUuid(const std::string& text, std::string_view what) {
  auto id = util::TryFromString(text);
  if (!id) {
    throw util::MalformedDocumentError("Invalid uuid '" + text + "' in " + std::string(what));
  }
  return *id;
}

void ExportFeatures(const data::Features& features, FeatureMap* out) {
  for (const auto& feature : features) {
    (*out)[feature.name] = feature.value;
  }
}

data::Features ImportFeatures(const FeatureMap& features) {
  data::Features out;
  out.reserve(features.size());
  for (const auto& [name, value] : features) {
    out.push_back({name, value});
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
  return out;
}

google::protobuf::ListValue EncodePredictedTag(std::uint32_t tag_id, double score) {
  google::protobuf::ListValue pair;
  pair.add_values()->set_number_value(static_cast<double>(tag_id));
  pair.add_values()->set_number_value(score);
  return pair;
}

PredictedTagRef DecodePredictedTag(const google::protobuf::ListValue& pair, const std::string& referrer) {
  if (pair.values_size() != 2 || !pair.values(0).has_number_value() || !pair.values(1).has_number_value()) {
    throw util::MalformedDocumentError("Predicted tag in " + referrer + " must be a [tag_id, score] pair");
  }

  const double raw_id = pair.values(0).number_value();
  if (raw_id < 0 || std::floor(raw_id) != raw_id || raw_id > static_cast<double>(UINT32_MAX)) {
    throw util::MalformedDocumentError("Predicted tag in " + referrer + " has non-integer tag id");
  }

  return {static_cast<std::uint32_t>(raw_id), pair.values(1).number_value()};
}

util::TimePoint ParseTimestampOr(bool present, const std::string& text, util::TimePoint fallback) {
  if (!present) {
    return fallback;
  }
  return util::FromIso8601(text);
}

} // namespace aoef::adapters
