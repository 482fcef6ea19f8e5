#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/data/annotations.hpp"
#include "internal/data/evaluations.hpp"
#include "internal/data/predictions.hpp"

namespace aoef::data {

/*
  Top-level collections.

  The kinds overlap: a Dataset is a RecordingSet with a name, an
  AnnotationProject and an EvaluationSet are AnnotationSets with extras, a
  ModelRun is a PredictionSet with a name. Dispatch on the runtime type must
  therefore test the derived kinds first.
*/

struct Collection {
  virtual ~Collection() = default;

  util::UUID      uuid{};
  util::TimePoint created_on{};
};

struct RecordingSet : Collection {
  std::vector<RecordingPtr> recordings;
};

struct Dataset : RecordingSet {
  std::string                name;
  std::optional<std::string> description;
};

struct AnnotationSet : Collection {
  std::vector<ClipAnnotationsPtr> clip_annotations;
};

struct AnnotationProject : AnnotationSet {
  std::string                    name;
  std::optional<std::string>     description;
  std::optional<std::string>     instructions;
  std::vector<Tag>               annotation_tags;
  std::vector<AnnotationTaskPtr> tasks;
};

struct EvaluationSet : AnnotationSet {
  std::string                name;
  std::optional<std::string> description;
  std::vector<Tag>           evaluation_tags;
};

struct PredictionSet : Collection {
  std::vector<ClipPredictionPtr> clip_predictions;
};

struct ModelRun : PredictionSet {
  std::string                name;
  std::optional<std::string> version;
  std::optional<std::string> description;
};

struct Evaluation : Collection {
  std::string                    evaluation_task;
  std::vector<ClipEvaluationPtr> clip_evaluations;
  Features                       metrics;
  std::optional<double>          score;
};

} // namespace aoef::data
