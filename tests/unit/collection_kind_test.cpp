#include "internal/collections/collection_kind.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using aoef::collections::CollectionKind;
using aoef::collections::KindOf;

struct Scrapbook : aoef::data::Collection {};

struct CuratedDataset : aoef::data::Dataset {};

void TestEveryKindHasAUniqueWireName() {
  for (auto kind : aoef::collections::kDispatchOrder) {
    const auto name   = aoef::collections::ToString(kind);
    const auto parsed = aoef::collections::ParseCollectionKind(name);
    assert(parsed.has_value());
    assert(*parsed == kind);
  }
  assert(!aoef::collections::ParseCollectionKind("Dataset").has_value());
  assert(!aoef::collections::ParseCollectionKind("").has_value());
}

void TestDerivedKindsWinOverBases() {
  assert(KindOf(aoef::data::Dataset{}) == CollectionKind::kDataset);
  assert(KindOf(aoef::data::RecordingSet{}) == CollectionKind::kRecordingSet);
  assert(KindOf(aoef::data::AnnotationProject{}) == CollectionKind::kAnnotationProject);
  assert(KindOf(aoef::data::EvaluationSet{}) == CollectionKind::kEvaluationSet);
  assert(KindOf(aoef::data::AnnotationSet{}) == CollectionKind::kAnnotationSet);
  assert(KindOf(aoef::data::ModelRun{}) == CollectionKind::kModelRun);
  assert(KindOf(aoef::data::PredictionSet{}) == CollectionKind::kPredictionSet);
  assert(KindOf(aoef::data::Evaluation{}) == CollectionKind::kEvaluation);
}

void TestDatasetIsAlsoARecordingSet() {
  aoef::data::Dataset dataset;
  assert(aoef::collections::Matches(CollectionKind::kRecordingSet, dataset));
  assert(!aoef::collections::Matches(CollectionKind::kRecordingSet, aoef::data::AnnotationSet{}));
}

void TestUserSubclassesDispatchToNearestKnownKind() {
  assert(KindOf(CuratedDataset{}) == CollectionKind::kDataset);
  assert(!KindOf(Scrapbook{}).has_value());
}

void TestBaseKinds() {
  static_assert(aoef::collections::BaseKind(CollectionKind::kModelRun) == CollectionKind::kPredictionSet);
  static_assert(!aoef::collections::BaseKind(CollectionKind::kEvaluation).has_value());
  static_assert(aoef::collections::DerivedKindsPrecedeBases());
}

} // namespace

int main() {
  TestEveryKindHasAUniqueWireName();
  TestDerivedKindsWinOverBases();
  TestDatasetIsAlsoARecordingSet();
  TestUserSubclassesDispatchToNearestKnownKind();
  TestBaseKinds();

  std::cout << "aoef_unit_collection_kind: pass\n";
  return 0;
}
