#pragma once

#include <memory>
#include <vector>

#include "internal/data/entities.hpp"

namespace aoef::data {

struct SoundEventPrediction {
  util::UUID                uuid{};
  SoundEventPtr             sound_event;
  double                    score = 0.0;
  std::vector<PredictedTag> tags;
};

using SoundEventPredictionPtr = std::shared_ptr<const SoundEventPrediction>;

struct SequencePrediction {
  util::UUID                uuid{};
  SequencePtr               sequence;
  double                    score = 0.0;
  std::vector<PredictedTag> tags;
};

using SequencePredictionPtr = std::shared_ptr<const SequencePrediction>;

struct ClipPrediction {
  util::UUID                           uuid{};
  ClipPtr                              clip;
  std::vector<SoundEventPredictionPtr> sound_events;
  std::vector<SequencePredictionPtr>   sequences;
  std::vector<PredictedTag>            tags;
  Features                             features;
};

using ClipPredictionPtr = std::shared_ptr<const ClipPrediction>;

} // namespace aoef::data
