#pragma once

#include "aoef/v1/records.pb.h"
#include "internal/adapters/clip_adapter.hpp"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/sequence_adapter.hpp"
#include "internal/adapters/sound_event_adapter.hpp"
#include "internal/adapters/tag_adapter.hpp"
#include "internal/data/predictions.hpp"

namespace aoef::adapters {

/*
  Prediction adapters mirror the annotation ones. Predicted tags travel as
  [tag_id, score] pairs.
*/

class SoundEventPredictionAdapter
    : public UuidAdapter<data::SoundEventPrediction, v1::SoundEventPredictionRecord> {
 public:
  SoundEventPredictionAdapter(SoundEventAdapter& sound_events, TagAdapter& tags);

 protected:
  v1::SoundEventPredictionRecord AssembleExchange(const data::SoundEventPredictionPtr& obj,
                                                  const util::UUID&                    id) override;
  data::SoundEventPredictionPtr  AssembleDomain(const v1::SoundEventPredictionRecord& record) override;

 private:
  SoundEventAdapter& sound_events_;
  TagAdapter&        tags_;
};

class SequencePredictionAdapter : public UuidAdapter<data::SequencePrediction, v1::SequencePredictionRecord> {
 public:
  SequencePredictionAdapter(SequenceAdapter& sequences, TagAdapter& tags);

 protected:
  v1::SequencePredictionRecord AssembleExchange(const data::SequencePredictionPtr& obj,
                                                const util::UUID&                  id) override;
  data::SequencePredictionPtr  AssembleDomain(const v1::SequencePredictionRecord& record) override;

 private:
  SequenceAdapter& sequences_;
  TagAdapter&      tags_;
};

class ClipPredictionsAdapter : public UuidAdapter<data::ClipPrediction, v1::ClipPredictionsRecord> {
 public:
  ClipPredictionsAdapter(ClipAdapter& clips, SoundEventPredictionAdapter& sound_event_predictions,
                         SequencePredictionAdapter& sequence_predictions, TagAdapter& tags);

 protected:
  v1::ClipPredictionsRecord AssembleExchange(const data::ClipPredictionPtr& obj, const util::UUID& id) override;
  data::ClipPredictionPtr   AssembleDomain(const v1::ClipPredictionsRecord& record) override;

 private:
  ClipAdapter&                 clips_;
  SoundEventPredictionAdapter& sound_event_predictions_;
  SequencePredictionAdapter&   sequence_predictions_;
  TagAdapter&                  tags_;
};

} // namespace aoef::adapters
