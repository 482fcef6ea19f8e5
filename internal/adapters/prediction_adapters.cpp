#include "internal/adapters/prediction_adapters.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

namespace {

template <typename Field>
void ExportPredictedTags(const std::vector<data::PredictedTag>& tags, TagAdapter& adapter, Field* out) {
  for (const auto& predicted : tags) {
    *out->Add() = EncodePredictedTag(adapter.ToExchange(predicted.tag).id(), predicted.score);
  }
}

template <typename Field>
std::vector<data::PredictedTag> ImportPredictedTags(const Field& pairs, const TagAdapter& adapter,
                                                    const std::string& referrer) {
  std::vector<data::PredictedTag> out;
  out.reserve(pairs.size());
  for (const auto& pair : pairs) {
    const auto ref = DecodePredictedTag(pair, referrer);
    out.push_back({Resolve(adapter, ref.tag_id, "Tag", referrer), ref.score});
  }
  return out;
}

} // namespace

// ------------------------------------------------------------
// Sound event predictions
// ------------------------------------------------------------

SoundEventPredictionAdapter::SoundEventPredictionAdapter(SoundEventAdapter& sound_events, TagAdapter& tags)
    : UuidAdapter("SoundEventPrediction"), sound_events_(sound_events), tags_(tags) {
}

v1::SoundEventPredictionRecord SoundEventPredictionAdapter::AssembleExchange(
    const data::SoundEventPredictionPtr& obj, const util::UUID& id) {
  v1::SoundEventPredictionRecord record;
  record.set_uuid(util::ToString(id));
  record.set_sound_event(sound_events_.ToExchange(obj->sound_event).uuid());
  record.set_score(obj->score);
  ExportPredictedTags(obj->tags, tags_, record.mutable_tags());
  return record;
}

data::SoundEventPredictionPtr SoundEventPredictionAdapter::AssembleDomain(
    const v1::SoundEventPredictionRecord& record) {
  const auto self = Describe("sound event prediction", record.uuid());

  auto prediction         = std::make_shared<data::SoundEventPrediction>();
  prediction->uuid        = ParseUuid(record.uuid(), self);
  prediction->sound_event = ResolveUuid(sound_events_, record.sound_event(), "SoundEvent", self);
  prediction->score       = record.score();
  prediction->tags        = ImportPredictedTags(record.tags(), tags_, self);
  return prediction;
}

// ------------------------------------------------------------
// Sequence predictions
// ------------------------------------------------------------

SequencePredictionAdapter::SequencePredictionAdapter(SequenceAdapter& sequences, TagAdapter& tags)
    : UuidAdapter("SequencePrediction"), sequences_(sequences), tags_(tags) {
}

v1::SequencePredictionRecord SequencePredictionAdapter::AssembleExchange(const data::SequencePredictionPtr& obj,
                                                                         const util::UUID&                  id) {
  v1::SequencePredictionRecord record;
  record.set_uuid(util::ToString(id));
  record.set_sequence(sequences_.ToExchange(obj->sequence).uuid());
  record.set_score(obj->score);
  ExportPredictedTags(obj->tags, tags_, record.mutable_tags());
  return record;
}

data::SequencePredictionPtr SequencePredictionAdapter::AssembleDomain(const v1::SequencePredictionRecord& record) {
  const auto self = Describe("sequence prediction", record.uuid());

  auto prediction      = std::make_shared<data::SequencePrediction>();
  prediction->uuid     = ParseUuid(record.uuid(), self);
  prediction->sequence = ResolveUuid(sequences_, record.sequence(), "Sequence", self);
  prediction->score    = record.score();
  prediction->tags     = ImportPredictedTags(record.tags(), tags_, self);
  return prediction;
}

// ------------------------------------------------------------
// Clip predictions
// ------------------------------------------------------------

ClipPredictionsAdapter::ClipPredictionsAdapter(ClipAdapter& clips, SoundEventPredictionAdapter& sound_event_predictions,
                                               SequencePredictionAdapter& sequence_predictions, TagAdapter& tags)
    : UuidAdapter("ClipPredictions"),
      clips_(clips),
      sound_event_predictions_(sound_event_predictions),
      sequence_predictions_(sequence_predictions),
      tags_(tags) {
}

v1::ClipPredictionsRecord ClipPredictionsAdapter::AssembleExchange(const data::ClipPredictionPtr& obj,
                                                                   const util::UUID&               id) {
  v1::ClipPredictionsRecord record;
  record.set_uuid(util::ToString(id));
  record.set_clip(clips_.ToExchange(obj->clip).uuid());
  for (const auto& prediction : obj->sound_events) {
    record.add_sound_events(sound_event_predictions_.ToExchange(prediction).uuid());
  }
  for (const auto& prediction : obj->sequences) {
    record.add_sequences(sequence_predictions_.ToExchange(prediction).uuid());
  }
  ExportPredictedTags(obj->tags, tags_, record.mutable_tags());
  ExportFeatures(obj->features, record.mutable_features());
  return record;
}

data::ClipPredictionPtr ClipPredictionsAdapter::AssembleDomain(const v1::ClipPredictionsRecord& record) {
  const auto self = Describe("clip predictions", record.uuid());

  auto predictions  = std::make_shared<data::ClipPrediction>();
  predictions->uuid = ParseUuid(record.uuid(), self);
  predictions->clip = ResolveUuid(clips_, record.clip(), "Clip", self);
  for (const auto& id : record.sound_events()) {
    predictions->sound_events.push_back(ResolveUuid(sound_event_predictions_, id, "SoundEventPrediction", self));
  }
  for (const auto& id : record.sequences()) {
    predictions->sequences.push_back(ResolveUuid(sequence_predictions_, id, "SequencePrediction", self));
  }
  predictions->tags     = ImportPredictedTags(record.tags(), tags_, self);
  predictions->features = ImportFeatures(record.features());
  return predictions;
}

} // namespace aoef::adapters
