#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/data/collections.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aoef::testing {

// Small builders for domain graphs used across the tests. Every builder
// draws a fresh uuid and stamps the current time where a field needs one.

inline std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "aoef_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline data::RecordingPtr NewRecording(std::filesystem::path path = "site_a/rec_001.wav",
                                       std::vector<data::Tag> tags = {}) {
  auto recording        = std::make_shared<data::Recording>();
  recording->uuid       = util::GenerateUUID();
  recording->path       = std::move(path);
  recording->duration   = 60.0;
  recording->samplerate = 48000;
  recording->tags       = std::move(tags);
  return recording;
}

inline data::ClipPtr NewClip(const data::RecordingPtr& recording, double start = 0.0, double end = 5.0) {
  auto clip        = std::make_shared<data::Clip>();
  clip->uuid       = util::GenerateUUID();
  clip->recording  = recording;
  clip->start_time = start;
  clip->end_time   = end;
  return clip;
}

inline data::SoundEventPtr NewSoundEvent(const data::RecordingPtr& recording) {
  auto sound_event       = std::make_shared<data::SoundEvent>();
  sound_event->uuid      = util::GenerateUUID();
  sound_event->recording = recording;

  data::Geometry geometry;
  geometry.set_type("BoundingBox");
  auto* coords = geometry.mutable_coordinates()->mutable_list_value();
  for (double v : {0.5, 1000.0, 1.5, 4000.0}) {
    coords->add_values()->set_number_value(v);
  }
  sound_event->geometry = geometry;
  sound_event->features = {{"duration", 1.0}};
  return sound_event;
}

inline data::SequencePtr NewSequence(std::vector<data::SoundEventPtr> sound_events,
                                     data::SequencePtr                parent = nullptr) {
  auto sequence          = std::make_shared<data::Sequence>();
  sequence->uuid         = util::GenerateUUID();
  sequence->sound_events = std::move(sound_events);
  sequence->parent       = std::move(parent);
  return sequence;
}

inline data::SoundEventAnnotationPtr NewSoundEventAnnotation(const data::SoundEventPtr& sound_event,
                                                             std::vector<data::Tag>      tags,
                                                             std::optional<data::User>   created_by = std::nullopt) {
  auto annotation         = std::make_shared<data::SoundEventAnnotation>();
  annotation->uuid        = util::GenerateUUID();
  annotation->sound_event = sound_event;
  annotation->tags        = std::move(tags);
  annotation->created_by  = std::move(created_by);
  annotation->created_on  = util::Now();
  return annotation;
}

inline data::SequenceAnnotationPtr NewSequenceAnnotation(const data::SequencePtr& sequence,
                                                         std::vector<data::Tag>   tags) {
  auto annotation        = std::make_shared<data::SequenceAnnotation>();
  annotation->uuid       = util::GenerateUUID();
  annotation->sequence   = sequence;
  annotation->tags       = std::move(tags);
  annotation->created_on = util::Now();
  return annotation;
}

inline data::ClipAnnotationsPtr NewClipAnnotations(const data::ClipPtr&                        clip,
                                                    std::vector<data::SoundEventAnnotationPtr> sound_events,
                                                    std::vector<data::SequenceAnnotationPtr>   sequences = {}) {
  auto annotations          = std::make_shared<data::ClipAnnotations>();
  annotations->uuid         = util::GenerateUUID();
  annotations->clip         = clip;
  annotations->sound_events = std::move(sound_events);
  annotations->sequences    = std::move(sequences);
  annotations->created_on   = util::Now();
  return annotations;
}

inline data::SoundEventPredictionPtr NewSoundEventPrediction(const data::SoundEventPtr&     sound_event,
                                                             double                         score,
                                                             std::vector<data::PredictedTag> tags) {
  auto prediction         = std::make_shared<data::SoundEventPrediction>();
  prediction->uuid        = util::GenerateUUID();
  prediction->sound_event = sound_event;
  prediction->score       = score;
  prediction->tags        = std::move(tags);
  return prediction;
}

inline data::ClipPredictionPtr NewClipPrediction(const data::ClipPtr&                        clip,
                                                 std::vector<data::SoundEventPredictionPtr> sound_events) {
  auto prediction          = std::make_shared<data::ClipPrediction>();
  prediction->uuid         = util::GenerateUUID();
  prediction->clip         = clip;
  prediction->sound_events = std::move(sound_events);
  return prediction;
}

inline data::MatchPtr NewMatch(data::SoundEventPredictionPtr source, data::SoundEventAnnotationPtr target,
                               double affinity) {
  auto match      = std::make_shared<data::Match>();
  match->uuid     = util::GenerateUUID();
  match->source   = std::move(source);
  match->target   = std::move(target);
  match->affinity = affinity;
  return match;
}

inline data::AnnotationTaskPtr NewTask(const data::ClipPtr& clip, std::optional<data::User> owner) {
  auto task        = std::make_shared<data::AnnotationTask>();
  task->uuid       = util::GenerateUUID();
  task->clip       = clip;
  task->created_on = util::Now();

  data::StatusBadge assigned;
  assigned.state      = data::AnnotationState::kAssigned;
  assigned.owner      = owner;
  assigned.created_on = util::Now();
  task->status_badges.push_back(assigned);

  data::StatusBadge completed = assigned;
  completed.state             = data::AnnotationState::kCompleted;
  task->status_badges.push_back(completed);
  return task;
}

/*
  One clip with two annotated sound events on a shared recording, a
  two-level sequence, and a prediction per sound event. Enough to populate
  every record list of every collection kind.
*/
struct Scene {
  data::User                    annotator = data::MakeUser("annotator");
  data::RecordingPtr            recording;
  data::ClipPtr                 clip;
  data::SoundEventPtr           bark;
  data::SoundEventPtr           howl;
  data::SequencePtr             parent_sequence;
  data::SequencePtr             child_sequence;
  data::SoundEventAnnotationPtr bark_annotation;
  data::SoundEventAnnotationPtr howl_annotation;
  data::SequenceAnnotationPtr   sequence_annotation;
  data::ClipAnnotationsPtr      clip_annotations;
  data::SoundEventPredictionPtr bark_prediction;
  data::SoundEventPredictionPtr howl_prediction;
  data::ClipPredictionPtr       clip_prediction;
  data::ClipEvaluationPtr       clip_evaluation;
  data::AnnotationTaskPtr       task;

  Scene() {
    auto dog = data::MakeTag("species", "dog");

    auto rec   = std::make_shared<data::Recording>(*NewRecording("site_a/rec_001.wav", {data::MakeTag("site", "a")}));
    rec->notes = {data::MakeNote("wind noise after 40s", annotator)};
    rec->owners = {annotator};
    recording   = rec;

    clip = NewClip(recording, 10.0, 20.0);
    bark = NewSoundEvent(recording);
    howl = NewSoundEvent(recording);

    parent_sequence = NewSequence({bark, howl});
    child_sequence  = NewSequence({howl}, parent_sequence);

    bark_annotation     = NewSoundEventAnnotation(bark, {dog, data::MakeTag("call", "bark")}, annotator);
    howl_annotation     = NewSoundEventAnnotation(howl, {dog}, annotator);
    sequence_annotation = NewSequenceAnnotation(child_sequence, {dog});

    auto annotations   = std::make_shared<data::ClipAnnotations>(
        *NewClipAnnotations(clip, {bark_annotation, howl_annotation}, {sequence_annotation}));
    annotations->tags  = {data::MakeTag("quality", "good")};
    annotations->notes = {data::MakeNote("checked", annotator)};
    clip_annotations   = annotations;

    bark_prediction = NewSoundEventPrediction(bark, 0.9, {{dog, 0.8}});
    howl_prediction = NewSoundEventPrediction(howl, 0.4, {{data::MakeTag("species", "wolf"), 0.3}});

    auto prediction      = std::make_shared<data::ClipPrediction>(*NewClipPrediction(clip, {bark_prediction, howl_prediction}));
    prediction->tags     = {{dog, 0.7}};
    prediction->features = {{"snr", 12.5}};
    clip_prediction      = prediction;

    auto evaluation         = std::make_shared<data::ClipEvaluation>();
    evaluation->uuid        = util::GenerateUUID();
    evaluation->annotations = clip_annotations;
    evaluation->predictions = clip_prediction;
    evaluation->matches     = {NewMatch(bark_prediction, bark_annotation, 0.95),
                               NewMatch(howl_prediction, nullptr, 0.0),
                               NewMatch(nullptr, howl_annotation, 0.0)};
    evaluation->metrics     = {{"precision", 0.5}, {"recall", 0.5}};
    evaluation->score       = 0.5;
    clip_evaluation         = evaluation;

    task = NewTask(clip, annotator);
  }

  template <typename T>
  void Stamp(T& collection) const {
    collection.uuid       = util::GenerateUUID();
    collection.created_on = util::Now();
  }

  data::RecordingSet MakeRecordingSet() const {
    data::RecordingSet set;
    Stamp(set);
    set.recordings = {recording, NewRecording("site_b/rec_002.wav")};
    return set;
  }

  data::Dataset MakeDataset() const {
    data::Dataset dataset;
    Stamp(dataset);
    dataset.recordings  = {recording};
    dataset.name        = "dawn chorus";
    dataset.description = "May 2024 deployment";
    return dataset;
  }

  data::AnnotationSet MakeAnnotationSet() const {
    data::AnnotationSet set;
    Stamp(set);
    set.clip_annotations = {clip_annotations};
    return set;
  }

  data::AnnotationProject MakeAnnotationProject() const {
    data::AnnotationProject project;
    Stamp(project);
    project.clip_annotations = {clip_annotations};
    project.name             = "barks";
    project.instructions     = "Box every bark.";
    project.annotation_tags  = {data::MakeTag("species", "dog"), data::MakeTag("species", "wolf")};
    project.tasks            = {task};
    return project;
  }

  data::EvaluationSet MakeEvaluationSet() const {
    data::EvaluationSet set;
    Stamp(set);
    set.clip_annotations = {clip_annotations};
    set.name             = "held out";
    set.evaluation_tags  = {data::MakeTag("species", "dog")};
    return set;
  }

  data::PredictionSet MakePredictionSet() const {
    data::PredictionSet set;
    Stamp(set);
    set.clip_predictions = {clip_prediction};
    return set;
  }

  data::ModelRun MakeModelRun() const {
    data::ModelRun run;
    Stamp(run);
    run.clip_predictions = {clip_prediction};
    run.name             = "detector";
    run.version          = "2.3.0";
    return run;
  }

  data::Evaluation MakeEvaluation() const {
    data::Evaluation evaluation;
    Stamp(evaluation);
    evaluation.evaluation_task  = "sound_event_detection";
    evaluation.clip_evaluations = {clip_evaluation};
    evaluation.metrics          = {{"mAP", 0.61}};
    evaluation.score            = 0.61;
    return evaluation;
  }
};

} // namespace aoef::testing
