#include "internal/collections/collection_adapter.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/data/equivalence.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using aoef::collections::CollectionKind;
using aoef::collections::MakeCollectionAdapter;

template <typename T>
void CheckRoundTrip(const T& original, CollectionKind kind) {
  const auto record = MakeCollectionAdapter(kind)->Export(original);
  assert(record.collection_type() == aoef::collections::ToString(kind));
  assert(record.uuid() == aoef::util::ToString(original.uuid));

  const auto back = MakeCollectionAdapter(kind)->Import(record);
  assert(back != nullptr);
  assert(dynamic_cast<const T*>(back.get()) != nullptr);
  assert(aoef::data::Equivalent(original, *back));
}

void TestEveryKindRoundTrips() {
  aoef::testing::Scene scene;

  CheckRoundTrip(scene.MakeRecordingSet(), CollectionKind::kRecordingSet);
  CheckRoundTrip(scene.MakeDataset(), CollectionKind::kDataset);
  CheckRoundTrip(scene.MakeAnnotationSet(), CollectionKind::kAnnotationSet);
  CheckRoundTrip(scene.MakeAnnotationProject(), CollectionKind::kAnnotationProject);
  CheckRoundTrip(scene.MakeEvaluationSet(), CollectionKind::kEvaluationSet);
  CheckRoundTrip(scene.MakePredictionSet(), CollectionKind::kPredictionSet);
  CheckRoundTrip(scene.MakeModelRun(), CollectionKind::kModelRun);
  CheckRoundTrip(scene.MakeEvaluation(), CollectionKind::kEvaluation);
}

void TestSharedRecordingWrittenOnce() {
  aoef::testing::Scene scene;

  // Clip, both sound events and the sequences all hang off one recording.
  const auto record = MakeCollectionAdapter(CollectionKind::kAnnotationSet)->Export(scene.MakeAnnotationSet());
  assert(record.recordings_size() == 1);
  assert(record.clips_size() == 1);
  assert(record.sound_events_size() == 2);
  assert(record.sequences_size() == 2);
  assert(record.users_size() == 1);

  std::set<std::uint32_t> ids;
  for (const auto& tag : record.tags()) {
    ids.insert(tag.id());
  }
  assert(ids.size() == static_cast<std::size_t>(record.tags_size()));
}

void TestKindOnlyEmitsItsOwnLists() {
  aoef::testing::Scene scene;

  const auto recordings = MakeCollectionAdapter(CollectionKind::kRecordingSet)->Export(scene.MakeRecordingSet());
  assert(recordings.clips_size() == 0);
  assert(recordings.clip_annotations_size() == 0);

  const auto predictions = MakeCollectionAdapter(CollectionKind::kModelRun)->Export(scene.MakeModelRun());
  assert(predictions.clip_predictions_size() == 1);
  assert(predictions.sound_event_predictions_size() == 2);
  assert(predictions.clip_annotations_size() == 0);
  assert(predictions.name() == "detector");
  assert(predictions.version() == "2.3.0");

  const auto project = MakeCollectionAdapter(CollectionKind::kAnnotationProject)->Export(scene.MakeAnnotationProject());
  assert(project.tasks_size() == 1);
  assert(project.project_tags_size() == 2);
  assert(project.instructions() == "Box every bark.");

  const auto evaluation = MakeCollectionAdapter(CollectionKind::kEvaluation)->Export(scene.MakeEvaluation());
  assert(evaluation.matches_size() == 3);
  assert(evaluation.clip_evaluations_size() == 1);
  assert(evaluation.evaluation_task() == "sound_event_detection");
}

void TestExportRejectsWrongKind() {
  aoef::testing::Scene scene;

  bool threw = false;
  try {
    MakeCollectionAdapter(CollectionKind::kDataset)->Export(scene.MakeRecordingSet());
  } catch (const aoef::util::UnsupportedTypeError&) {
    threw = true;
  }
  assert(threw);
}

void TestDatasetExportsAsRecordingSetWhenAsked() {
  aoef::testing::Scene scene;

  // A dataset is a recording set; exporting it as one drops the name.
  const auto record = MakeCollectionAdapter(CollectionKind::kRecordingSet)->Export(scene.MakeDataset());
  assert(record.collection_type() == "recording_set");
  assert(!record.has_name());
}

void TestIdsAreDeterministic() {
  aoef::testing::Scene scene;
  const auto           project = scene.MakeAnnotationProject();

  const auto first  = MakeCollectionAdapter(CollectionKind::kAnnotationProject)->Export(project);
  const auto second = MakeCollectionAdapter(CollectionKind::kAnnotationProject)->Export(project);

  assert(first.tags_size() == second.tags_size());
  for (int i = 0; i < first.tags_size(); ++i) {
    assert(first.tags(i).id() == second.tags(i).id());
    assert(first.tags(i).key() == second.tags(i).key());
    assert(first.tags(i).value() == second.tags(i).value());
  }
  assert(first.users_size() == second.users_size());
  for (int i = 0; i < first.users_size(); ++i) {
    assert(first.users(i).id() == second.users(i).id());
  }
}

void TestAdapterInstanceIsReusable() {
  aoef::testing::Scene scene;
  const auto           set     = scene.MakeAnnotationSet();
  auto                 adapter = MakeCollectionAdapter(CollectionKind::kAnnotationSet);

  const auto first  = adapter->Export(set);
  const auto second = adapter->Export(set);
  assert(second.recordings_size() == first.recordings_size());
  assert(second.clip_annotations_size() == first.clip_annotations_size());
  assert(second.tags_size() == first.tags_size());
  assert(second.tags(0).id() == 0);

  const auto back = adapter->Import(second);
  assert(aoef::data::Equivalent(set, *back));

  const auto third = adapter->Export(*back);
  assert(third.sound_events_size() == first.sound_events_size());
}

void TestMissingCreatedOnDefaultsToNow() {
  aoef::testing::Scene scene;

  auto record = MakeCollectionAdapter(CollectionKind::kRecordingSet)->Export(scene.MakeRecordingSet());
  record.clear_created_on();

  const auto before = aoef::util::Now();
  const auto back   = MakeCollectionAdapter(CollectionKind::kRecordingSet)->Import(record);
  assert(back->created_on >= before);
}

} // namespace

int main() {
  TestEveryKindRoundTrips();
  TestSharedRecordingWrittenOnce();
  TestKindOnlyEmitsItsOwnLists();
  TestExportRejectsWrongKind();
  TestDatasetExportsAsRecordingSetWhenAsked();
  TestIdsAreDeterministic();
  TestAdapterInstanceIsReusable();
  TestMissingCreatedOnDefaultsToNow();

  std::cout << "aoef_unit_collection_adapter: pass\n";
  return 0;
}
