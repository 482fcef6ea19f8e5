#include "internal/adapters/sound_event_adapter.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

SoundEventAdapter::SoundEventAdapter(RecordingAdapter& recordings)
    : UuidAdapter("SoundEvent"), recordings_(recordings) {
}

v1::SoundEventRecord SoundEventAdapter::AssembleExchange(const data::SoundEventPtr& obj, const util::UUID& id) {
  v1::SoundEventRecord record;
  record.set_uuid(util::ToString(id));
  record.set_recording(recordings_.ToExchange(obj->recording).uuid());
  if (obj->geometry) {
    *record.mutable_geometry() = *obj->geometry;
  }
  ExportFeatures(obj->features, record.mutable_features());
  return record;
}

data::SoundEventPtr SoundEventAdapter::AssembleDomain(const v1::SoundEventRecord& record) {
  const auto self = Describe("sound event", record.uuid());

  auto sound_event       = std::make_shared<data::SoundEvent>();
  sound_event->uuid      = ParseUuid(record.uuid(), self);
  sound_event->recording = ResolveUuid(recordings_, record.recording(), "Recording", self);
  if (record.has_geometry()) {
    sound_event->geometry = record.geometry();
  }
  sound_event->features = ImportFeatures(record.features());
  return sound_event;
}

} // namespace aoef::adapters
