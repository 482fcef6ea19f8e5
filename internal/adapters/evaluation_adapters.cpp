#include "internal/adapters/evaluation_adapters.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

namespace {

MatchKey KeyOf(const data::MatchPtr& match) {
  if (!match) {
    throw util::InvalidArgument("null Match reference in domain graph");
  }

  MatchKey key;
  if (match->source) key.first = match->source->uuid;
  if (match->target) key.second = match->target->uuid;
  return key;
}

} // namespace

// ------------------------------------------------------------
// Matches
// ------------------------------------------------------------

MatchAdapter::MatchAdapter(SoundEventAnnotationAdapter& sound_event_annotations,
                           SoundEventPredictionAdapter& sound_event_predictions)
    : DataAdapter(KeyOf, [](const data::MatchPtr& match, std::size_t) { return match->uuid; },
                  [](const v1::MatchRecord& record) { return ParseUuid(record.uuid(), "match record"); }),
      sound_event_annotations_(sound_event_annotations),
      sound_event_predictions_(sound_event_predictions) {
}

v1::MatchRecord MatchAdapter::AssembleExchange(const data::MatchPtr& obj, const util::UUID& id) {
  v1::MatchRecord record;
  record.set_uuid(util::ToString(id));
  if (obj->source) {
    record.set_source(sound_event_predictions_.ToExchange(obj->source).uuid());
  }
  if (obj->target) {
    record.set_target(sound_event_annotations_.ToExchange(obj->target).uuid());
  }
  record.set_affinity(obj->affinity);
  if (obj->score) {
    record.set_score(*obj->score);
  }
  ExportFeatures(obj->metrics, record.mutable_metrics());
  return record;
}

data::MatchPtr MatchAdapter::AssembleDomain(const v1::MatchRecord& record) {
  const auto self = Describe("match", record.uuid());

  auto match  = std::make_shared<data::Match>();
  match->uuid = ParseUuid(record.uuid(), self);
  if (record.has_source()) {
    match->source = ResolveUuid(sound_event_predictions_, record.source(), "SoundEventPrediction", self);
  }
  if (record.has_target()) {
    match->target = ResolveUuid(sound_event_annotations_, record.target(), "SoundEventAnnotation", self);
  }
  match->affinity = record.affinity();
  if (record.has_score()) {
    match->score = record.score();
  }
  match->metrics = ImportFeatures(record.metrics());
  return match;
}

// ------------------------------------------------------------
// Clip evaluations
// ------------------------------------------------------------

ClipEvaluationAdapter::ClipEvaluationAdapter(ClipAnnotationsAdapter& clip_annotations,
                                             ClipPredictionsAdapter& clip_predictions, MatchAdapter& matches)
    : UuidAdapter("ClipEvaluation"),
      clip_annotations_(clip_annotations),
      clip_predictions_(clip_predictions),
      matches_(matches) {
}

v1::ClipEvaluationRecord ClipEvaluationAdapter::AssembleExchange(const data::ClipEvaluationPtr& obj,
                                                                 const util::UUID&               id) {
  v1::ClipEvaluationRecord record;
  record.set_uuid(util::ToString(id));
  record.set_annotations(clip_annotations_.ToExchange(obj->annotations).uuid());
  record.set_predictions(clip_predictions_.ToExchange(obj->predictions).uuid());
  for (const auto& match : obj->matches) {
    record.add_matches(matches_.ToExchange(match).uuid());
  }
  ExportFeatures(obj->metrics, record.mutable_metrics());
  if (obj->score) {
    record.set_score(*obj->score);
  }
  return record;
}

data::ClipEvaluationPtr ClipEvaluationAdapter::AssembleDomain(const v1::ClipEvaluationRecord& record) {
  const auto self = Describe("clip evaluation", record.uuid());

  auto evaluation         = std::make_shared<data::ClipEvaluation>();
  evaluation->uuid        = ParseUuid(record.uuid(), self);
  evaluation->annotations = ResolveUuid(clip_annotations_, record.annotations(), "ClipAnnotations", self);
  evaluation->predictions = ResolveUuid(clip_predictions_, record.predictions(), "ClipPredictions", self);
  for (const auto& id : record.matches()) {
    evaluation->matches.push_back(ResolveUuid(matches_, id, "Match", self));
  }
  evaluation->metrics = ImportFeatures(record.metrics());
  if (record.has_score()) {
    evaluation->score = record.score();
  }
  return evaluation;
}

} // namespace aoef::adapters
