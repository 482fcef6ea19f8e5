#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/data/annotations.hpp"
#include "internal/data/predictions.hpp"

namespace aoef::data {

// Either side may be absent: an unmatched prediction or a missed annotation.
struct Match {
  util::UUID              uuid{};
  SoundEventPredictionPtr source;
  SoundEventAnnotationPtr target;
  double                  affinity = 0.0;
  std::optional<double>   score;
  Features                metrics;
};

using MatchPtr = std::shared_ptr<const Match>;

struct ClipEvaluation {
  util::UUID            uuid{};
  ClipAnnotationsPtr    annotations;
  ClipPredictionPtr     predictions;
  std::vector<MatchPtr> matches;
  Features              metrics;
  std::optional<double> score;
};

using ClipEvaluationPtr = std::shared_ptr<const ClipEvaluation>;

} // namespace aoef::data
