#pragma once

#include "aoef/v1/records.pb.h"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/recording_adapter.hpp"
#include "internal/data/entities.hpp"

namespace aoef::adapters {

// Geometry passes through untouched in both directions.
class SoundEventAdapter : public UuidAdapter<data::SoundEvent, v1::SoundEventRecord> {
 public:
  explicit SoundEventAdapter(RecordingAdapter& recordings);

 protected:
  v1::SoundEventRecord AssembleExchange(const data::SoundEventPtr& obj, const util::UUID& id) override;
  data::SoundEventPtr  AssembleDomain(const v1::SoundEventRecord& record) override;

 private:
  RecordingAdapter& recordings_;
};

} // namespace aoef::adapters
