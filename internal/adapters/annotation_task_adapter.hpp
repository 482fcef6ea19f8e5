#pragma once

#include "aoef/v1/records.pb.h"
#include "internal/adapters/clip_adapter.hpp"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/user_adapter.hpp"
#include "internal/data/annotations.hpp"

namespace aoef::adapters {

// Status badges are embedded; their owners are user ids.
class AnnotationTaskAdapter : public UuidAdapter<data::AnnotationTask, v1::AnnotationTaskRecord> {
 public:
  AnnotationTaskAdapter(ClipAdapter& clips, UserAdapter& users);

 protected:
  v1::AnnotationTaskRecord AssembleExchange(const data::AnnotationTaskPtr& obj, const util::UUID& id) override;
  data::AnnotationTaskPtr  AssembleDomain(const v1::AnnotationTaskRecord& record) override;

 private:
  ClipAdapter& clips_;
  UserAdapter& users_;
};

} // namespace aoef::adapters
