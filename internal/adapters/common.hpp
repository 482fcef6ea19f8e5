#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/map.h>
#include <google/protobuf/struct.pb.h>

#include "internal/data/values.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aoef::adapters {

/*
  Conversion helpers shared by the entity adapters.
*/

using FeatureMap = google::protobuf::Map<std::string, double>;

std::string IdToString(std::uint32_t id);
std::string IdToString(const util::UUID& id);

// "<kind> <uuid>", used to name the record that holds a broken reference.
std::string Describe(std::string_view kind, const std::string& uuid);

util::UUID ParseUuid(const std::string& text, std::string_view what);

/*
  Looks up an already imported object by exchange id. Import order
  guarantees that every legal reference was hydrated before its referrer.
*/
template <typename Adapter, typename Id>
const auto& Resolve(const Adapter& adapter, const Id& id, std::string_view kind, const std::string& referrer) {
  const auto* obj = adapter.FromId(id);
  if (!obj) {
    throw util::MissingReferenceError(std::string(kind), IdToString(id), referrer);
  }
  return *obj;
}

template <typename Adapter>
const auto& ResolveUuid(const Adapter& adapter, const std::string& id, std::string_view kind,
                        const std::string& referrer) {
  return Resolve(adapter, ParseUuid(id, std::string(kind) + " reference in " + referrer), kind, referrer);
}

void           ExportFeatures(const data::Features& features, FeatureMap* out);
data::Features ImportFeatures(const FeatureMap& features);

google::protobuf::ListValue EncodePredictedTag(std::uint32_t tag_id, double score);

struct PredictedTagRef {
  std::uint32_t tag_id = 0;
  double        score  = 0.0;
};

PredictedTagRef DecodePredictedTag(const google::protobuf::ListValue& pair, const std::string& referrer);

// Missing timestamps default to the import time.
util::TimePoint ParseTimestampOr(bool present, const std::string& text, util::TimePoint fallback);

} // namespace aoef::adapters
