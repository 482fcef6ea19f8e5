#include "internal/adapters/annotation_task_adapter.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

AnnotationTaskAdapter::AnnotationTaskAdapter(ClipAdapter& clips, UserAdapter& users)
    : UuidAdapter("AnnotationTask"), clips_(clips), users_(users) {
}

v1::AnnotationTaskRecord AnnotationTaskAdapter::AssembleExchange(const data::AnnotationTaskPtr& obj,
                                                                 const util::UUID&               id) {
  v1::AnnotationTaskRecord record;
  record.set_uuid(util::ToString(id));
  record.set_clip(clips_.ToExchange(obj->clip).uuid());
  for (const auto& badge : obj->status_badges) {
    auto* out = record.add_status_badges();
    out->set_state(std::string(data::ToString(badge.state)));
    if (badge.owner) {
      out->set_owner(users_.ToExchange(*badge.owner).id());
    }
    out->set_created_on(util::ToIso8601(badge.created_on));
  }
  record.set_created_on(util::ToIso8601(obj->created_on));
  return record;
}

data::AnnotationTaskPtr AnnotationTaskAdapter::AssembleDomain(const v1::AnnotationTaskRecord& record) {
  const auto self = Describe("annotation task", record.uuid());
  const auto now  = util::Now();

  auto task  = std::make_shared<data::AnnotationTask>();
  task->uuid = ParseUuid(record.uuid(), self);
  task->clip = ResolveUuid(clips_, record.clip(), "Clip", self);
  for (const auto& badge : record.status_badges()) {
    auto state = data::ParseAnnotationState(badge.state());
    if (!state) {
      throw util::MalformedDocumentError("Unknown annotation state '" + badge.state() + "' in " + self);
    }

    data::StatusBadge out;
    out.state = *state;
    if (badge.has_owner()) {
      out.owner = Resolve(users_, badge.owner(), "User", self);
    }
    out.created_on = ParseTimestampOr(badge.has_created_on(), badge.created_on(), now);
    task->status_badges.push_back(std::move(out));
  }
  task->created_on = ParseTimestampOr(record.has_created_on(), record.created_on(), now);
  return task;
}

} // namespace aoef::adapters
