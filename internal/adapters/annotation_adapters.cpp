#include "internal/adapters/annotation_adapters.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

// ------------------------------------------------------------
// Sound event annotations
// ------------------------------------------------------------

SoundEventAnnotationAdapter::SoundEventAnnotationAdapter(UserAdapter& users, TagAdapter& tags, NoteAdapter& notes,
                                                         SoundEventAdapter& sound_events)
    : UuidAdapter("SoundEventAnnotation"), users_(users), tags_(tags), notes_(notes), sound_events_(sound_events) {
}

v1::SoundEventAnnotationRecord SoundEventAnnotationAdapter::AssembleExchange(
    const data::SoundEventAnnotationPtr& obj, const util::UUID& id) {
  v1::SoundEventAnnotationRecord record;
  record.set_uuid(util::ToString(id));
  record.set_sound_event(sound_events_.ToExchange(obj->sound_event).uuid());
  for (const auto& note : obj->notes) {
    *record.add_notes() = notes_.ToExchange(note);
  }
  for (const auto& tag : obj->tags) {
    record.add_tags(tags_.ToExchange(tag).id());
  }
  if (obj->created_by) {
    record.set_created_by(users_.ToExchange(*obj->created_by).id());
  }
  record.set_created_on(util::ToIso8601(obj->created_on));
  return record;
}

data::SoundEventAnnotationPtr SoundEventAnnotationAdapter::AssembleDomain(
    const v1::SoundEventAnnotationRecord& record) {
  const auto self = Describe("sound event annotation", record.uuid());

  auto annotation         = std::make_shared<data::SoundEventAnnotation>();
  annotation->uuid        = ParseUuid(record.uuid(), self);
  annotation->sound_event = ResolveUuid(sound_events_, record.sound_event(), "SoundEvent", self);
  for (const auto& note : record.notes()) {
    annotation->notes.push_back(notes_.ToDomain(note, self));
  }
  for (auto tag_id : record.tags()) {
    annotation->tags.push_back(Resolve(tags_, tag_id, "Tag", self));
  }
  if (record.has_created_by()) {
    annotation->created_by = Resolve(users_, record.created_by(), "User", self);
  }
  annotation->created_on = ParseTimestampOr(record.has_created_on(), record.created_on(), util::Now());
  return annotation;
}

// ------------------------------------------------------------
// Sequence annotations
// ------------------------------------------------------------

SequenceAnnotationAdapter::SequenceAnnotationAdapter(UserAdapter& users, TagAdapter& tags, NoteAdapter& notes,
                                                     SequenceAdapter& sequences)
    : UuidAdapter("SequenceAnnotation"), users_(users), tags_(tags), notes_(notes), sequences_(sequences) {
}

v1::SequenceAnnotationRecord SequenceAnnotationAdapter::AssembleExchange(const data::SequenceAnnotationPtr& obj,
                                                                         const util::UUID&                  id) {
  v1::SequenceAnnotationRecord record;
  record.set_uuid(util::ToString(id));
  record.set_sequence(sequences_.ToExchange(obj->sequence).uuid());
  for (const auto& note : obj->notes) {
    *record.add_notes() = notes_.ToExchange(note);
  }
  for (const auto& tag : obj->tags) {
    record.add_tags(tags_.ToExchange(tag).id());
  }
  if (obj->created_by) {
    record.set_created_by(users_.ToExchange(*obj->created_by).id());
  }
  record.set_created_on(util::ToIso8601(obj->created_on));
  return record;
}

data::SequenceAnnotationPtr SequenceAnnotationAdapter::AssembleDomain(const v1::SequenceAnnotationRecord& record) {
  const auto self = Describe("sequence annotation", record.uuid());

  auto annotation      = std::make_shared<data::SequenceAnnotation>();
  annotation->uuid     = ParseUuid(record.uuid(), self);
  annotation->sequence = ResolveUuid(sequences_, record.sequence(), "Sequence", self);
  for (const auto& note : record.notes()) {
    annotation->notes.push_back(notes_.ToDomain(note, self));
  }
  for (auto tag_id : record.tags()) {
    annotation->tags.push_back(Resolve(tags_, tag_id, "Tag", self));
  }
  if (record.has_created_by()) {
    annotation->created_by = Resolve(users_, record.created_by(), "User", self);
  }
  annotation->created_on = ParseTimestampOr(record.has_created_on(), record.created_on(), util::Now());
  return annotation;
}

// ------------------------------------------------------------
// Clip annotations
// ------------------------------------------------------------

ClipAnnotationsAdapter::ClipAnnotationsAdapter(ClipAdapter& clips, TagAdapter& tags, NoteAdapter& notes,
                                               SoundEventAnnotationAdapter& sound_event_annotations,
                                               SequenceAnnotationAdapter&   sequence_annotations)
    : UuidAdapter("ClipAnnotations"),
      clips_(clips),
      tags_(tags),
      notes_(notes),
      sound_event_annotations_(sound_event_annotations),
      sequence_annotations_(sequence_annotations) {
}

v1::ClipAnnotationsRecord ClipAnnotationsAdapter::AssembleExchange(const data::ClipAnnotationsPtr& obj,
                                                                   const util::UUID&               id) {
  v1::ClipAnnotationsRecord record;
  record.set_uuid(util::ToString(id));
  record.set_clip(clips_.ToExchange(obj->clip).uuid());
  for (const auto& tag : obj->tags) {
    record.add_tags(tags_.ToExchange(tag).id());
  }
  for (const auto& annotation : obj->sound_events) {
    record.add_sound_events(sound_event_annotations_.ToExchange(annotation).uuid());
  }
  for (const auto& annotation : obj->sequences) {
    record.add_sequences(sequence_annotations_.ToExchange(annotation).uuid());
  }
  for (const auto& note : obj->notes) {
    *record.add_notes() = notes_.ToExchange(note);
  }
  record.set_created_on(util::ToIso8601(obj->created_on));
  return record;
}

data::ClipAnnotationsPtr ClipAnnotationsAdapter::AssembleDomain(const v1::ClipAnnotationsRecord& record) {
  const auto self = Describe("clip annotations", record.uuid());

  auto annotations  = std::make_shared<data::ClipAnnotations>();
  annotations->uuid = ParseUuid(record.uuid(), self);
  annotations->clip = ResolveUuid(clips_, record.clip(), "Clip", self);
  for (auto tag_id : record.tags()) {
    annotations->tags.push_back(Resolve(tags_, tag_id, "Tag", self));
  }
  for (const auto& id : record.sound_events()) {
    annotations->sound_events.push_back(ResolveUuid(sound_event_annotations_, id, "SoundEventAnnotation", self));
  }
  for (const auto& id : record.sequences()) {
    annotations->sequences.push_back(ResolveUuid(sequence_annotations_, id, "SequenceAnnotation", self));
  }
  for (const auto& note : record.notes()) {
    annotations->notes.push_back(notes_.ToDomain(note, self));
  }
  annotations->created_on = ParseTimestampOr(record.has_created_on(), record.created_on(), util::Now());
  return annotations;
}

} // namespace aoef::adapters
