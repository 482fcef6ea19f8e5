#include <cassert>
#include <iostream>
#include <string>

#include "internal/adapters/common.hpp"
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
  for (const auto& r : out.sound_event_predictions.Values()) in.sound_event_predictions.ToDomain(r);
  for (const auto& r : out.sequence_predictions.Values()) in.sequence_predictions.ToDomain(r);
}

void TestPredictedTagsArePairs() {
  aoef::testing::Scene scene;

  auto        out    = BuildAdapterTree({});
  const auto& record = out->sound_event_predictions.ToExchange(scene.bark_prediction);
  assert(record.score() == 0.9);
  assert(record.tags_size() == 1);

  const auto& pair = record.tags(0);
  assert(pair.values_size() == 2);
  const auto tag_id = static_cast<std::uint32_t>(pair.values(0).number_value());
  assert(out->tags.FromId(tag_id) != nullptr);
  assert(out->tags.FromId(tag_id)->value == "dog");
  assert(pair.values(1).number_value() == 0.8);
}

void TestClipPredictionRoundTrip() {
  aoef::testing::Scene scene;

  auto       out    = BuildAdapterTree({});
  const auto record = out->clip_predictions.ToExchange(scene.clip_prediction);
  assert(record.sound_events_size() == 2);
  assert(record.features().at("snr") == 12.5);

  auto in = BuildAdapterTree({});
  Replay(*out, *in);
  auto back = in->clip_predictions.ToDomain(record);
  assert(aoef::data::Equivalent(*back, *scene.clip_prediction));
}

void TestSequencePredictionRoundTrip() {
  aoef::testing::Scene scene;

  auto prediction      = std::make_shared<aoef::data::SequencePrediction>();
  prediction->uuid     = aoef::util::GenerateUUID();
  prediction->sequence = scene.child_sequence;
  prediction->score    = 0.25;
  prediction->tags     = {{aoef::data::MakeTag("species", "dog"), 0.2}};

  auto       out    = BuildAdapterTree({});
  const auto record = out->sequence_predictions.ToExchange(prediction);
  // child and its parent
  assert(out->sequences.Values().size() == 2);

  auto in = BuildAdapterTree({});
  Replay(*out, *in);
  auto back = in->sequence_predictions.ToDomain(record);
  assert(aoef::data::Equivalent(*back, *prediction));
}

void TestMalformedPairsAreRejected() {
  google::protobuf::ListValue too_short;
  too_short.add_values()->set_number_value(0);

  google::protobuf::ListValue fractional_id;
  fractional_id.add_values()->set_number_value(1.5);
  fractional_id.add_values()->set_number_value(0.3);

  google::protobuf::ListValue string_score;
  string_score.add_values()->set_number_value(1);
  string_score.add_values()->set_string_value("high");

  for (const auto* pair : {&too_short, &fractional_id, &string_score}) {
    bool threw = false;
    try {
      (void)aoef::adapters::DecodePredictedTag(*pair, "prediction x");
    } catch (const aoef::util::MalformedDocumentError&) {
      threw = true;
    }
    assert(threw);
  }

  const auto ok = aoef::adapters::DecodePredictedTag(aoef::adapters::EncodePredictedTag(3, 0.75), "prediction x");
  assert(ok.tag_id == 3);
  assert(ok.score == 0.75);
}

} // namespace

int main() {
  TestPredictedTagsArePairs();
  TestClipPredictionRoundTrip();
  TestSequencePredictionRoundTrip();
  TestMalformedPairsAreRejected();

  std::cout << "aoef_unit_prediction_adapter: pass\n";
  return 0;
}
