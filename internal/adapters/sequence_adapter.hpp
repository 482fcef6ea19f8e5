#pragma once

#include <google/protobuf/repeated_ptr_field.h>

#include "aoef/v1/records.pb.h"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/sound_event_adapter.hpp"
#include "internal/data/entities.hpp"

namespace aoef::adapters {

/*
  Sequence <-> SequenceRecord.

  Sequences form parent chains of arbitrary length. Both directions walk the
  chain with an explicit worklist and hydrate ancestors first, so a parent
  always precedes its child in Values() and nesting depth never grows with
  chain length. A chain that loops back on itself raises
  CyclicReferenceError.
*/
class SequenceAdapter : public UuidAdapter<data::Sequence, v1::SequenceRecord> {
 public:
  explicit SequenceAdapter(SoundEventAdapter& sound_events);

  // Imports every record, in any order, resolving parents within the list.
  void ImportAll(const google::protobuf::RepeatedPtrField<v1::SequenceRecord>& records);

 protected:
  v1::SequenceRecord AssembleExchange(const data::SequencePtr& obj, const util::UUID& id) override;
  data::SequencePtr  AssembleDomain(const v1::SequenceRecord& record) override;

 private:
  SoundEventAdapter& sound_events_;
};

} // namespace aoef::adapters
