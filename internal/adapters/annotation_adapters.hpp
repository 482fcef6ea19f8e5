#pragma once

#include "aoef/v1/records.pb.h"
#include "internal/adapters/clip_adapter.hpp"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/note_adapter.hpp"
#include "internal/adapters/sequence_adapter.hpp"
#include "internal/adapters/sound_event_adapter.hpp"
#include "internal/adapters/tag_adapter.hpp"
#include "internal/adapters/user_adapter.hpp"
#include "internal/data/annotations.hpp"

namespace aoef::adapters {

class SoundEventAnnotationAdapter
    : public UuidAdapter<data::SoundEventAnnotation, v1::SoundEventAnnotationRecord> {
 public:
  SoundEventAnnotationAdapter(UserAdapter& users, TagAdapter& tags, NoteAdapter& notes,
                              SoundEventAdapter& sound_events);

 protected:
  v1::SoundEventAnnotationRecord AssembleExchange(const data::SoundEventAnnotationPtr& obj,
                                                  const util::UUID&                    id) override;
  data::SoundEventAnnotationPtr  AssembleDomain(const v1::SoundEventAnnotationRecord& record) override;

 private:
  UserAdapter&       users_;
  TagAdapter&        tags_;
  NoteAdapter&       notes_;
  SoundEventAdapter& sound_events_;
};

class SequenceAnnotationAdapter : public UuidAdapter<data::SequenceAnnotation, v1::SequenceAnnotationRecord> {
 public:
  SequenceAnnotationAdapter(UserAdapter& users, TagAdapter& tags, NoteAdapter& notes, SequenceAdapter& sequences);

 protected:
  v1::SequenceAnnotationRecord AssembleExchange(const data::SequenceAnnotationPtr& obj,
                                                const util::UUID&                  id) override;
  data::SequenceAnnotationPtr  AssembleDomain(const v1::SequenceAnnotationRecord& record) override;

 private:
  UserAdapter&     users_;
  TagAdapter&      tags_;
  NoteAdapter&     notes_;
  SequenceAdapter& sequences_;
};

/*
  All annotations attached to one clip: clip-level tags and notes plus the
  sound event and sequence annotations made inside it.
*/
class ClipAnnotationsAdapter : public UuidAdapter<data::ClipAnnotations, v1::ClipAnnotationsRecord> {
 public:
  ClipAnnotationsAdapter(ClipAdapter& clips, TagAdapter& tags, NoteAdapter& notes,
                         SoundEventAnnotationAdapter& sound_event_annotations,
                         SequenceAnnotationAdapter&   sequence_annotations);

 protected:
  v1::ClipAnnotationsRecord AssembleExchange(const data::ClipAnnotationsPtr& obj, const util::UUID& id) override;
  data::ClipAnnotationsPtr  AssembleDomain(const v1::ClipAnnotationsRecord& record) override;

 private:
  ClipAdapter&                 clips_;
  TagAdapter&                  tags_;
  NoteAdapter&                 notes_;
  SoundEventAnnotationAdapter& sound_event_annotations_;
  SequenceAnnotationAdapter&   sequence_annotations_;
};

} // namespace aoef::adapters
