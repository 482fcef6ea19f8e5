#include "internal/adapters/clip_adapter.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

ClipAdapter::ClipAdapter(RecordingAdapter& recordings) : UuidAdapter("Clip"), recordings_(recordings) {
}

v1::ClipRecord ClipAdapter::AssembleExchange(const data::ClipPtr& obj, const util::UUID& id) {
  v1::ClipRecord record;
  record.set_uuid(util::ToString(id));
  record.set_recording(recordings_.ToExchange(obj->recording).uuid());
  record.set_start_time(obj->start_time);
  record.set_end_time(obj->end_time);
  ExportFeatures(obj->features, record.mutable_features());
  return record;
}

data::ClipPtr ClipAdapter::AssembleDomain(const v1::ClipRecord& record) {
  const auto self = Describe("clip", record.uuid());

  auto clip        = std::make_shared<data::Clip>();
  clip->uuid       = ParseUuid(record.uuid(), self);
  clip->recording  = ResolveUuid(recordings_, record.recording(), "Recording", self);
  clip->start_time = record.start_time();
  clip->end_time   = record.end_time();
  clip->features   = ImportFeatures(record.features());
  return clip;
}

} // namespace aoef::adapters
