#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "internal/adapters/annotation_adapters.hpp"
#include "internal/adapters/annotation_task_adapter.hpp"
#include "internal/adapters/clip_adapter.hpp"
#include "internal/adapters/evaluation_adapters.hpp"
#include "internal/adapters/note_adapter.hpp"
#include "internal/adapters/prediction_adapters.hpp"
#include "internal/adapters/recording_adapter.hpp"
#include "internal/adapters/sequence_adapter.hpp"
#include "internal/adapters/sound_event_adapter.hpp"
#include "internal/adapters/tag_adapter.hpp"
#include "internal/adapters/user_adapter.hpp"

namespace aoef::factory {

struct AdapterOptions {
  std::optional<std::filesystem::path> audio_dir;
};

/*
  AdapterTree

  Owns one instance of every entity adapter, wired to each other by
  reference. Members are declared leaves first so each adapter is built after
  everything it refers to. The tree and all of its identity maps live for a
  single save or load call.
*/
struct AdapterTree {
  explicit AdapterTree(const AdapterOptions& options);

  AdapterTree(const AdapterTree&)            = delete;
  AdapterTree& operator=(const AdapterTree&) = delete;

  adapters::UserAdapter users;
  adapters::TagAdapter  tags;
  adapters::NoteAdapter notes;

  adapters::RecordingAdapter  recordings;
  adapters::ClipAdapter       clips;
  adapters::SoundEventAdapter sound_events;
  adapters::SequenceAdapter   sequences;

  adapters::SoundEventAnnotationAdapter sound_event_annotations;
  adapters::SequenceAnnotationAdapter   sequence_annotations;
  adapters::ClipAnnotationsAdapter      clip_annotations;

  adapters::SoundEventPredictionAdapter sound_event_predictions;
  adapters::SequencePredictionAdapter   sequence_predictions;
  adapters::ClipPredictionsAdapter      clip_predictions;

  adapters::MatchAdapter          matches;
  adapters::ClipEvaluationAdapter clip_evaluations;

  adapters::AnnotationTaskAdapter tasks;
};

/*
  BuildAdapterTree

  Composition root of the engine: the only place that knows how the
  adapters depend on each other.
*/
std::unique_ptr<AdapterTree> BuildAdapterTree(const AdapterOptions& options);

} // namespace aoef::factory
