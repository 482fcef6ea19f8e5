#pragma once

#include <memory>
#include <vector>

#include "internal/data/collections.hpp"

namespace aoef::data {

/*
  Deep structural comparison of domain graphs.

  Shared edges are followed and compared by content, not by pointer, so a
  graph rebuilt from a document compares equal to the one that produced it.
  Feature and metric lists compare as sets keyed by name; every other list is
  ordered.
*/

bool Equivalent(const Tag& lhs, const Tag& rhs);
bool Equivalent(const PredictedTag& lhs, const PredictedTag& rhs);
bool Equivalent(const User& lhs, const User& rhs);
bool Equivalent(const Note& lhs, const Note& rhs);
bool EquivalentFeatures(const Features& lhs, const Features& rhs);

bool Equivalent(const Recording& lhs, const Recording& rhs);
bool Equivalent(const Clip& lhs, const Clip& rhs);
bool Equivalent(const SoundEvent& lhs, const SoundEvent& rhs);
bool Equivalent(const Sequence& lhs, const Sequence& rhs);

bool Equivalent(const SoundEventAnnotation& lhs, const SoundEventAnnotation& rhs);
bool Equivalent(const SequenceAnnotation& lhs, const SequenceAnnotation& rhs);
bool Equivalent(const ClipAnnotations& lhs, const ClipAnnotations& rhs);
bool Equivalent(const StatusBadge& lhs, const StatusBadge& rhs);
bool Equivalent(const AnnotationTask& lhs, const AnnotationTask& rhs);

bool Equivalent(const SoundEventPrediction& lhs, const SoundEventPrediction& rhs);
bool Equivalent(const SequencePrediction& lhs, const SequencePrediction& rhs);
bool Equivalent(const ClipPrediction& lhs, const ClipPrediction& rhs);

bool Equivalent(const Match& lhs, const Match& rhs);
bool Equivalent(const ClipEvaluation& lhs, const ClipEvaluation& rhs);

// Collections must also agree on their concrete kind.
bool Equivalent(const Collection& lhs, const Collection& rhs);

template <typename T>
bool Equivalent(const std::shared_ptr<const T>& lhs, const std::shared_ptr<const T>& rhs) {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return lhs == rhs || Equivalent(*lhs, *rhs);
}

template <typename T>
bool Equivalent(const std::optional<T>& lhs, const std::optional<T>& rhs) {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return Equivalent(*lhs, *rhs);
}

template <typename T>
bool Equivalent(const std::vector<T>& lhs, const std::vector<T>& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!Equivalent(lhs[i], rhs[i])) {
      return false;
    }
  }
  return true;
}

} // namespace aoef::data
