#include <cassert>
#include <iostream>
#include <string>

#include "internal/data/equivalence.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"

namespace {

using aoef::factory::AdapterTree;
using aoef::factory::BuildAdapterTree;

void Replay(const AdapterTree& out, AdapterTree& in) {
  for (const auto& r : out.users.Values()) in.users.ToDomain(r);
  for (const auto& r : out.tags.Values()) in.tags.ToDomain(r);
  for (const auto& r : out.recordings.Values()) in.recordings.ToDomain(r);
  for (const auto& r : out.clips.Values()) in.clips.ToDomain(r);
  for (const auto& r : out.sound_events.Values()) in.sound_events.ToDomain(r);
  for (const auto& r : out.sequences.Values()) in.sequences.ToDomain(r);
  for (const auto& r : out.sound_event_annotations.Values()) in.sound_event_annotations.ToDomain(r);
  for (const auto& r : out.sequence_annotations.Values()) in.sequence_annotations.ToDomain(r);
  for (const auto& r : out.sound_event_predictions.Values()) in.sound_event_predictions.ToDomain(r);
  for (const auto& r : out.sequence_predictions.Values()) in.sequence_predictions.ToDomain(r);
  for (const auto& r : out.clip_annotations.Values()) in.clip_annotations.ToDomain(r);
  for (const auto& r : out.clip_predictions.Values()) in.clip_predictions.ToDomain(r);
  for (const auto& r : out.matches.Values()) in.matches.ToDomain(r);
}

void TestMatchesKeyedOnTheirPair() {
  aoef::testing::Scene scene;

  auto first  = aoef::testing::NewMatch(scene.bark_prediction, scene.bark_annotation, 0.9);
  auto second = aoef::testing::NewMatch(scene.bark_prediction, scene.bark_annotation, 0.1);

  auto        out = BuildAdapterTree({});
  const auto& a   = out->matches.ToExchange(first);
  const auto& b   = out->matches.ToExchange(second);

  assert(a.uuid() == b.uuid());
  assert(a.uuid() == aoef::util::ToString(first->uuid));
  assert(out->matches.Values().size() == 1);
}

void TestUnmatchedSidesAreOmitted() {
  aoef::testing::Scene scene;

  auto out = BuildAdapterTree({});

  const auto missed = out->matches.ToExchange(aoef::testing::NewMatch(nullptr, scene.howl_annotation, 0.0));
  assert(!missed.has_source());
  assert(missed.has_target());

  const auto false_alarm = out->matches.ToExchange(aoef::testing::NewMatch(scene.howl_prediction, nullptr, 0.0));
  assert(false_alarm.has_source());
  assert(!false_alarm.has_target());
  assert(false_alarm.affinity() == 0.0);
}

void TestClipEvaluationRoundTrip() {
  aoef::testing::Scene scene;

  auto       out    = BuildAdapterTree({});
  const auto record = out->clip_evaluations.ToExchange(scene.clip_evaluation);
  assert(record.matches_size() == 3);
  assert(record.score() == 0.5);
  assert(record.metrics().size() == 2);

  auto in = BuildAdapterTree({});
  Replay(*out, *in);
  auto back = in->clip_evaluations.ToDomain(record);
  assert(aoef::data::Equivalent(*back, *scene.clip_evaluation));
}

void TestMatchWithUnknownPredictionFails() {
  const auto missing = aoef::util::ToString(aoef::util::GenerateUUID());

  aoef::v1::MatchRecord record;
  record.set_uuid(aoef::util::ToString(aoef::util::GenerateUUID()));
  record.set_source(missing);
  record.set_affinity(0.5);

  auto in    = BuildAdapterTree({});
  bool threw = false;
  try {
    in->matches.ToDomain(record);
  } catch (const aoef::util::MissingReferenceError& e) {
    threw = true;
    assert(e.kind() == "SoundEventPrediction");
    assert(e.missing_id() == missing);
  }
  assert(threw);
}

} // namespace

int main() {
  TestMatchesKeyedOnTheirPair();
  TestUnmatchedSidesAreOmitted();
  TestClipEvaluationRoundTrip();
  TestMatchWithUnknownPredictionFails();

  std::cout << "aoef_unit_evaluation_adapter: pass\n";
  return 0;
}
