#include "internal/adapters/sequence_adapter.hpp"

#include <map>
#include <memory>
#include <set>
#include <vector>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

SequenceAdapter::SequenceAdapter(SoundEventAdapter& sound_events)
    : UuidAdapter("Sequence"), sound_events_(sound_events) {
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

v1::SequenceRecord SequenceAdapter::AssembleExchange(const data::SequencePtr& obj, const util::UUID& id) {
  // Collect ancestors that still need a record, nearest first.
  std::vector<data::SequencePtr> pending;
  std::set<util::UUID>           seen{id};
  for (auto parent = obj->parent; parent; parent = parent->parent) {
    if (!seen.insert(parent->uuid).second) {
      throw util::CyclicReferenceError("Sequence " + util::ToString(id) + " has a cyclic parent chain through " +
                                       util::ToString(parent->uuid));
    }
    if (HasRecord(parent->uuid)) {
      break;
    }
    pending.push_back(parent);
  }

  // Root first: each ancestor then finds its own parent already exported.
  for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
    ToExchange(*it);
  }

  v1::SequenceRecord record;
  record.set_uuid(util::ToString(id));
  for (const auto& sound_event : obj->sound_events) {
    record.add_sound_events(sound_events_.ToExchange(sound_event).uuid());
  }
  ExportFeatures(obj->features, record.mutable_features());
  if (obj->parent) {
    record.set_parent(ToExchange(obj->parent).uuid());
  }
  return record;
}

// ------------------------------------------------------------
// Import
// ------------------------------------------------------------

data::SequencePtr SequenceAdapter::AssembleDomain(const v1::SequenceRecord& record) {
  const auto self = Describe("sequence", record.uuid());

  auto sequence  = std::make_shared<data::Sequence>();
  sequence->uuid = ParseUuid(record.uuid(), self);
  for (const auto& sound_event_id : record.sound_events()) {
    sequence->sound_events.push_back(ResolveUuid(sound_events_, sound_event_id, "SoundEvent", self));
  }
  sequence->features = ImportFeatures(record.features());
  if (record.has_parent()) {
    sequence->parent = ResolveUuid(*this, record.parent(), "Sequence", self);
  }
  return sequence;
}

void SequenceAdapter::ImportAll(const google::protobuf::RepeatedPtrField<v1::SequenceRecord>& records) {
  std::map<util::UUID, const v1::SequenceRecord*> by_uuid;
  for (const auto& record : records) {
    by_uuid.emplace(ParseUuid(record.uuid(), Describe("sequence", record.uuid())), &record);
  }

  for (const auto& record : records) {
    std::vector<const v1::SequenceRecord*> chain;
    std::set<util::UUID>                   seen;

    const v1::SequenceRecord* current = &record;
    while (current) {
      const auto uuid = ParseUuid(current->uuid(), Describe("sequence", current->uuid()));
      if (FromId(uuid)) {
        break;
      }
      if (!seen.insert(uuid).second) {
        throw util::CyclicReferenceError("Sequence " + current->uuid() + " has a cyclic parent chain");
      }
      chain.push_back(current);

      if (!current->has_parent()) {
        break;
      }
      const auto self   = Describe("sequence", current->uuid());
      const auto parent = ParseUuid(current->parent(), "parent of " + self);
      if (FromId(parent)) {
        break;
      }
      auto it = by_uuid.find(parent);
      if (it == by_uuid.end()) {
        throw util::MissingReferenceError("Sequence", current->parent(), self);
      }
      current = it->second;
    }

    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
      ToDomain(**it);
    }
  }
}

} // namespace aoef::adapters
