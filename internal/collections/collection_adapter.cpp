#include "internal/collections/collection_adapter.hpp"

#include <deque>
#include <string>
#include <vector>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/adapters/common.hpp"
#include "internal/util/errors.hpp"

namespace aoef::collections {

namespace {

using adapters::Describe;
using adapters::ParseUuid;
using adapters::Resolve;

template <typename Record>
void CopyInto(const std::deque<Record>& values, google::protobuf::RepeatedPtrField<Record>* out) {
  out->Reserve(static_cast<int>(values.size()));
  for (const auto& value : values) {
    *out->Add() = value;
  }
}

template <typename Adapter, typename Records>
void HydrateEach(Adapter& adapter, const Records& records) {
  for (const auto& record : records) {
    adapter.ToDomain(record);
  }
}

// ------------------------------------------------------------
// Recording sets
// ------------------------------------------------------------

class RecordingSetAdapter : public CollectionAdapter {
 public:
  explicit RecordingSetAdapter(const factory::AdapterOptions& options,
                               CollectionKind                 kind = CollectionKind::kRecordingSet)
      : CollectionAdapter(kind, kRecordingLists, options) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord*) override {
    ExportRecordings(static_cast<const data::RecordingSet&>(obj));
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto set = std::make_shared<data::RecordingSet>();
    ImportRecordings(record, *set);
    return set;
  }

  void ExportRecordings(const data::RecordingSet& set) {
    for (const auto& recording : set.recordings) {
      tree().recordings.ToExchange(recording);
    }
  }

  void ImportRecordings(const v1::CollectionRecord& record, data::RecordingSet& set) {
    for (const auto& recording : record.recordings()) {
      set.recordings.push_back(tree().recordings.ToDomain(recording));
    }
  }
};

class DatasetAdapter : public RecordingSetAdapter {
 public:
  explicit DatasetAdapter(const factory::AdapterOptions& options)
      : RecordingSetAdapter(options, CollectionKind::kDataset) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord* record) override {
    const auto& dataset = static_cast<const data::Dataset&>(obj);
    ExportRecordings(dataset);
    record->set_name(dataset.name);
    if (dataset.description) record->set_description(*dataset.description);
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto dataset = std::make_shared<data::Dataset>();
    ImportRecordings(record, *dataset);
    dataset->name = record.name();
    if (record.has_description()) dataset->description = record.description();
    return dataset;
  }
};

// ------------------------------------------------------------
// Annotation sets
// ------------------------------------------------------------

constexpr unsigned kAnnotationSetLists = kRecordingLists | kEntityLists | kAnnotationLists;

class AnnotationSetAdapter : public CollectionAdapter {
 public:
  explicit AnnotationSetAdapter(const factory::AdapterOptions& options,
                                CollectionKind                 kind  = CollectionKind::kAnnotationSet,
                                unsigned                       lists = kAnnotationSetLists)
      : CollectionAdapter(kind, lists, options) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord*) override {
    ExportClipAnnotations(static_cast<const data::AnnotationSet&>(obj));
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto set = std::make_shared<data::AnnotationSet>();
    ImportClipAnnotations(record, *set);
    return set;
  }

  void ExportClipAnnotations(const data::AnnotationSet& set) {
    for (const auto& annotations : set.clip_annotations) {
      tree().clip_annotations.ToExchange(annotations);
    }
  }

  void ImportClipAnnotations(const v1::CollectionRecord& record, data::AnnotationSet& set) {
    for (const auto& annotations : record.clip_annotations()) {
      set.clip_annotations.push_back(tree().clip_annotations.ToDomain(annotations));
    }
  }

  template <typename Field>
  std::vector<data::Tag> ResolveTags(const Field& ids, const std::string& referrer) {
    std::vector<data::Tag> tags;
    for (auto id : ids) {
      tags.push_back(Resolve(tree().tags, id, "Tag", referrer));
    }
    return tags;
  }
};

class AnnotationProjectAdapter : public AnnotationSetAdapter {
 public:
  explicit AnnotationProjectAdapter(const factory::AdapterOptions& options)
      : AnnotationSetAdapter(options, CollectionKind::kAnnotationProject, kAnnotationSetLists | kTaskList) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord* record) override {
    const auto& project = static_cast<const data::AnnotationProject&>(obj);
    ExportClipAnnotations(project);
    for (const auto& task : project.tasks) {
      tree().tasks.ToExchange(task);
    }
    for (const auto& tag : project.annotation_tags) {
      record->add_project_tags(tree().tags.ToExchange(tag).id());
    }
    record->set_name(project.name);
    if (project.description) record->set_description(*project.description);
    if (project.instructions) record->set_instructions(*project.instructions);
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto project = std::make_shared<data::AnnotationProject>();
    ImportClipAnnotations(record, *project);
    for (const auto& task : record.tasks()) {
      project->tasks.push_back(tree().tasks.ToDomain(task));
    }
    project->annotation_tags = ResolveTags(record.project_tags(), Describe("annotation project", record.uuid()));
    project->name            = record.name();
    if (record.has_description()) project->description = record.description();
    if (record.has_instructions()) project->instructions = record.instructions();
    return project;
  }
};

class EvaluationSetAdapter : public AnnotationSetAdapter {
 public:
  explicit EvaluationSetAdapter(const factory::AdapterOptions& options)
      : AnnotationSetAdapter(options, CollectionKind::kEvaluationSet) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord* record) override {
    const auto& set = static_cast<const data::EvaluationSet&>(obj);
    ExportClipAnnotations(set);
    for (const auto& tag : set.evaluation_tags) {
      record->add_evaluation_tags(tree().tags.ToExchange(tag).id());
    }
    record->set_name(set.name);
    if (set.description) record->set_description(*set.description);
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto set = std::make_shared<data::EvaluationSet>();
    ImportClipAnnotations(record, *set);
    set->evaluation_tags = ResolveTags(record.evaluation_tags(), Describe("evaluation set", record.uuid()));
    set->name            = record.name();
    if (record.has_description()) set->description = record.description();
    return set;
  }
};

// ------------------------------------------------------------
// Prediction sets
// ------------------------------------------------------------

constexpr unsigned kPredictionSetLists = kRecordingLists | kEntityLists | kPredictionLists;

class PredictionSetAdapter : public CollectionAdapter {
 public:
  explicit PredictionSetAdapter(const factory::AdapterOptions& options,
                                CollectionKind                 kind = CollectionKind::kPredictionSet)
      : CollectionAdapter(kind, kPredictionSetLists, options) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord*) override {
    ExportClipPredictions(static_cast<const data::PredictionSet&>(obj));
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto set = std::make_shared<data::PredictionSet>();
    ImportClipPredictions(record, *set);
    return set;
  }

  void ExportClipPredictions(const data::PredictionSet& set) {
    for (const auto& predictions : set.clip_predictions) {
      tree().clip_predictions.ToExchange(predictions);
    }
  }

  void ImportClipPredictions(const v1::CollectionRecord& record, data::PredictionSet& set) {
    for (const auto& predictions : record.clip_predictions()) {
      set.clip_predictions.push_back(tree().clip_predictions.ToDomain(predictions));
    }
  }
};

class ModelRunAdapter : public PredictionSetAdapter {
 public:
  explicit ModelRunAdapter(const factory::AdapterOptions& options)
      : PredictionSetAdapter(options, CollectionKind::kModelRun) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord* record) override {
    const auto& run = static_cast<const data::ModelRun&>(obj);
    ExportClipPredictions(run);
    record->set_name(run.name);
    if (run.version) record->set_version(*run.version);
    if (run.description) record->set_description(*run.description);
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto run = std::make_shared<data::ModelRun>();
    ImportClipPredictions(record, *run);
    run->name = record.name();
    if (record.has_version()) run->version = record.version();
    if (record.has_description()) run->description = record.description();
    return run;
  }
};

// ------------------------------------------------------------
// Evaluations
// ------------------------------------------------------------

class EvaluationAdapter : public CollectionAdapter {
 public:
  explicit EvaluationAdapter(const factory::AdapterOptions& options)
      : CollectionAdapter(CollectionKind::kEvaluation,
                          kRecordingLists | kEntityLists | kAnnotationLists | kPredictionLists | kEvaluationLists,
                          options) {
  }

 protected:
  void ExportRoot(const data::Collection& obj, v1::CollectionRecord* record) override {
    const auto& evaluation = static_cast<const data::Evaluation&>(obj);
    for (const auto& clip_evaluation : evaluation.clip_evaluations) {
      tree().clip_evaluations.ToExchange(clip_evaluation);
    }
    record->set_evaluation_task(evaluation.evaluation_task);
    adapters::ExportFeatures(evaluation.metrics, record->mutable_metrics());
    if (evaluation.score) record->set_score(*evaluation.score);
  }

  std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) override {
    auto evaluation = std::make_shared<data::Evaluation>();
    for (const auto& clip_evaluation : record.clip_evaluations()) {
      evaluation->clip_evaluations.push_back(tree().clip_evaluations.ToDomain(clip_evaluation));
    }
    evaluation->evaluation_task = record.evaluation_task();
    evaluation->metrics         = adapters::ImportFeatures(record.metrics());
    if (record.has_score()) evaluation->score = record.score();
    return evaluation;
  }
};

} // namespace

// ------------------------------------------------------------
// CollectionAdapter
// ------------------------------------------------------------

CollectionAdapter::CollectionAdapter(CollectionKind kind, unsigned lists, const factory::AdapterOptions& options)
    : kind_(kind), lists_(lists), options_(options) {
}

v1::CollectionRecord CollectionAdapter::Export(const data::Collection& obj) {
  if (!Matches(kind_, obj)) {
    throw util::UnsupportedTypeError("Cannot export collection " + util::ToString(obj.uuid) + " as " +
                                     std::string(ToString(kind_)));
  }

  tree_ = factory::BuildAdapterTree(options_);

  v1::CollectionRecord record;
  record.set_collection_type(std::string(ToString(kind_)));
  record.set_uuid(util::ToString(obj.uuid));
  record.set_created_on(util::ToIso8601(obj.created_on));

  ExportRoot(obj, &record);
  EmitLists(&record);
  return record;
}

std::shared_ptr<data::Collection> CollectionAdapter::Import(const v1::CollectionRecord& record) {
  const auto self = Describe(ToString(kind_), record.uuid());

  tree_ = factory::BuildAdapterTree(options_);
  HydrateLists(record);

  auto root        = ImportRoot(record);
  root->uuid       = ParseUuid(record.uuid(), self);
  root->created_on = adapters::ParseTimestampOr(record.has_created_on(), record.created_on(), util::Now());
  return root;
}

// Every adapter lists its records in first-completed order, which fixes the
// id assignment for a given input.
void CollectionAdapter::EmitLists(v1::CollectionRecord* record) const {
  const auto& t = *tree_;

  if (lists_ & kRecordingLists) {
    CopyInto(t.users.Values(), record->mutable_users());
    CopyInto(t.tags.Values(), record->mutable_tags());
    CopyInto(t.recordings.Values(), record->mutable_recordings());
  }
  if (lists_ & kEntityLists) {
    CopyInto(t.clips.Values(), record->mutable_clips());
    CopyInto(t.sound_events.Values(), record->mutable_sound_events());
    CopyInto(t.sequences.Values(), record->mutable_sequences());
  }
  if (lists_ & kAnnotationLists) {
    CopyInto(t.sound_event_annotations.Values(), record->mutable_sound_event_annotations());
    CopyInto(t.sequence_annotations.Values(), record->mutable_sequence_annotations());
    CopyInto(t.clip_annotations.Values(), record->mutable_clip_annotations());
  }
  if (lists_ & kPredictionLists) {
    CopyInto(t.sound_event_predictions.Values(), record->mutable_sound_event_predictions());
    CopyInto(t.sequence_predictions.Values(), record->mutable_sequence_predictions());
    CopyInto(t.clip_predictions.Values(), record->mutable_clip_predictions());
  }
  if (lists_ & kTaskList) {
    CopyInto(t.tasks.Values(), record->mutable_tasks());
  }
  if (lists_ & kEvaluationLists) {
    CopyInto(t.matches.Values(), record->mutable_matches());
    CopyInto(t.clip_evaluations.Values(), record->mutable_clip_evaluations());
  }
}

// Each stage only dereferences ids produced by an earlier one.
void CollectionAdapter::HydrateLists(const v1::CollectionRecord& record) {
  auto& t = *tree_;

  if (lists_ & kRecordingLists) {
    HydrateEach(t.users, record.users());
    HydrateEach(t.tags, record.tags());
    HydrateEach(t.recordings, record.recordings());
  }
  if (lists_ & kEntityLists) {
    HydrateEach(t.clips, record.clips());
    HydrateEach(t.sound_events, record.sound_events());
    t.sequences.ImportAll(record.sequences());
  }
  if (lists_ & kAnnotationLists) {
    HydrateEach(t.sound_event_annotations, record.sound_event_annotations());
    HydrateEach(t.sequence_annotations, record.sequence_annotations());
  }
  if (lists_ & kPredictionLists) {
    HydrateEach(t.sound_event_predictions, record.sound_event_predictions());
    HydrateEach(t.sequence_predictions, record.sequence_predictions());
  }
  if (lists_ & kAnnotationLists) {
    HydrateEach(t.clip_annotations, record.clip_annotations());
  }
  if (lists_ & kPredictionLists) {
    HydrateEach(t.clip_predictions, record.clip_predictions());
  }
  if (lists_ & kTaskList) {
    HydrateEach(t.tasks, record.tasks());
  }
  if (lists_ & kEvaluationLists) {
    HydrateEach(t.matches, record.matches());
    HydrateEach(t.clip_evaluations, record.clip_evaluations());
  }
}

// ------------------------------------------------------------
// Factory
// ------------------------------------------------------------

std::unique_ptr<CollectionAdapter> MakeCollectionAdapter(CollectionKind kind, const factory::AdapterOptions& options) {
  switch (kind) {
    case CollectionKind::kEvaluation:
      return std::make_unique<EvaluationAdapter>(options);
    case CollectionKind::kDataset:
      return std::make_unique<DatasetAdapter>(options);
    case CollectionKind::kAnnotationProject:
      return std::make_unique<AnnotationProjectAdapter>(options);
    case CollectionKind::kEvaluationSet:
      return std::make_unique<EvaluationSetAdapter>(options);
    case CollectionKind::kModelRun:
      return std::make_unique<ModelRunAdapter>(options);
    case CollectionKind::kAnnotationSet:
      return std::make_unique<AnnotationSetAdapter>(options);
    case CollectionKind::kPredictionSet:
      return std::make_unique<PredictionSetAdapter>(options);
    case CollectionKind::kRecordingSet:
      return std::make_unique<RecordingSetAdapter>(options);
  }
  throw util::UnsupportedTypeError("Unsupported collection kind");
}

} // namespace aoef::collections
