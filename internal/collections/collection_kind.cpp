#include "internal/collections/collection_kind.hpp"

namespace aoef::collections {

namespace {

template <typename T>
bool IsA(const data::Collection& obj) {
  return dynamic_cast<const T*>(&obj) != nullptr;
}

} // namespace

std::string_view ToString(CollectionKind kind) {
  switch (kind) {
    case CollectionKind::kEvaluation:
      return "evaluation";
    case CollectionKind::kDataset:
      return "dataset";
    case CollectionKind::kAnnotationProject:
      return "annotation_project";
    case CollectionKind::kEvaluationSet:
      return "evaluation_set";
    case CollectionKind::kModelRun:
      return "model_run";
    case CollectionKind::kAnnotationSet:
      return "annotation_set";
    case CollectionKind::kPredictionSet:
      return "prediction_set";
    case CollectionKind::kRecordingSet:
      return "recording_set";
  }
  return "unknown";
}

std::optional<CollectionKind> ParseCollectionKind(std::string_view text) {
  for (auto kind : kDispatchOrder) {
    if (ToString(kind) == text) {
      return kind;
    }
  }
  return std::nullopt;
}

bool Matches(CollectionKind kind, const data::Collection& obj) {
  switch (kind) {
    case CollectionKind::kEvaluation:
      return IsA<data::Evaluation>(obj);
    case CollectionKind::kDataset:
      return IsA<data::Dataset>(obj);
    case CollectionKind::kAnnotationProject:
      return IsA<data::AnnotationProject>(obj);
    case CollectionKind::kEvaluationSet:
      return IsA<data::EvaluationSet>(obj);
    case CollectionKind::kModelRun:
      return IsA<data::ModelRun>(obj);
    case CollectionKind::kAnnotationSet:
      return IsA<data::AnnotationSet>(obj);
    case CollectionKind::kPredictionSet:
      return IsA<data::PredictionSet>(obj);
    case CollectionKind::kRecordingSet:
      return IsA<data::RecordingSet>(obj);
  }
  return false;
}

std::optional<CollectionKind> KindOf(const data::Collection& obj) {
  for (auto kind : kDispatchOrder) {
    if (Matches(kind, obj)) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace aoef::collections
