#pragma once

#include <optional>
#include <utility>

#include "aoef/v1/records.pb.h"
#include "internal/adapters/annotation_adapters.hpp"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/prediction_adapters.hpp"
#include "internal/data/evaluations.hpp"

namespace aoef::adapters {

using MatchKey = std::pair<std::optional<util::UUID>, std::optional<util::UUID>>;

/*
  A match is identified by the (prediction, annotation) pair it links, not by
  its own uuid, so the same pairing reached twice yields one record.
*/
class MatchAdapter : public DataAdapter<data::MatchPtr, v1::MatchRecord, MatchKey, util::UUID> {
 public:
  MatchAdapter(SoundEventAnnotationAdapter& sound_event_annotations,
               SoundEventPredictionAdapter& sound_event_predictions);

 protected:
  v1::MatchRecord AssembleExchange(const data::MatchPtr& obj, const util::UUID& id) override;
  data::MatchPtr  AssembleDomain(const v1::MatchRecord& record) override;

 private:
  SoundEventAnnotationAdapter& sound_event_annotations_;
  SoundEventPredictionAdapter& sound_event_predictions_;
};

class ClipEvaluationAdapter : public UuidAdapter<data::ClipEvaluation, v1::ClipEvaluationRecord> {
 public:
  ClipEvaluationAdapter(ClipAnnotationsAdapter& clip_annotations, ClipPredictionsAdapter& clip_predictions,
                        MatchAdapter& matches);

 protected:
  v1::ClipEvaluationRecord AssembleExchange(const data::ClipEvaluationPtr& obj, const util::UUID& id) override;
  data::ClipEvaluationPtr  AssembleDomain(const v1::ClipEvaluationRecord& record) override;

 private:
  ClipAnnotationsAdapter& clip_annotations_;
  ClipPredictionsAdapter& clip_predictions_;
  MatchAdapter&           matches_;
};

} // namespace aoef::adapters
