#pragma once

#include "aoef/v1/records.pb.h"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/recording_adapter.hpp"
#include "internal/data/entities.hpp"

namespace aoef::adapters {

class ClipAdapter : public UuidAdapter<data::Clip, v1::ClipRecord> {
 public:
  explicit ClipAdapter(RecordingAdapter& recordings);

 protected:
  v1::ClipRecord AssembleExchange(const data::ClipPtr& obj, const util::UUID& id) override;
  data::ClipPtr  AssembleDomain(const v1::ClipRecord& record) override;

 private:
  RecordingAdapter& recordings_;
};

} // namespace aoef::adapters
