#include "internal/data/equivalence.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <map>
#include <set>
#include <typeinfo>

namespace aoef::data {

namespace {

std::map<std::string, double> FeatureMap(const Features& features) {
  std::map<std::string, double> out;
  for (const auto& feature : features) {
    out[feature.name] = feature.value;
  }
  return out;
}

bool SameSequenceFields(const Sequence& lhs, const Sequence& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.sound_events, rhs.sound_events) &&
         EquivalentFeatures(lhs.features, rhs.features);
}

bool SameRecordingSet(const RecordingSet& lhs, const RecordingSet& rhs) {
  return lhs.uuid == rhs.uuid && lhs.created_on == rhs.created_on && Equivalent(lhs.recordings, rhs.recordings);
}

bool SameAnnotationSet(const AnnotationSet& lhs, const AnnotationSet& rhs) {
  return lhs.uuid == rhs.uuid && lhs.created_on == rhs.created_on &&
         Equivalent(lhs.clip_annotations, rhs.clip_annotations);
}

bool SamePredictionSet(const PredictionSet& lhs, const PredictionSet& rhs) {
  return lhs.uuid == rhs.uuid && lhs.created_on == rhs.created_on &&
         Equivalent(lhs.clip_predictions, rhs.clip_predictions);
}

} // namespace

bool Equivalent(const Tag& lhs, const Tag& rhs) {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool Equivalent(const PredictedTag& lhs, const PredictedTag& rhs) {
  return Equivalent(lhs.tag, rhs.tag) && lhs.score == rhs.score;
}

bool Equivalent(const User& lhs, const User& rhs) {
  return lhs.uuid == rhs.uuid && lhs.username == rhs.username && lhs.email == rhs.email && lhs.name == rhs.name &&
         lhs.institution == rhs.institution;
}

bool Equivalent(const Note& lhs, const Note& rhs) {
  return lhs.uuid == rhs.uuid && lhs.message == rhs.message && Equivalent(lhs.created_by, rhs.created_by) &&
         lhs.is_issue == rhs.is_issue && lhs.created_on == rhs.created_on;
}

bool EquivalentFeatures(const Features& lhs, const Features& rhs) {
  return lhs.size() == rhs.size() && FeatureMap(lhs) == FeatureMap(rhs);
}

bool Equivalent(const Recording& lhs, const Recording& rhs) {
  return lhs.uuid == rhs.uuid && lhs.path.lexically_normal() == rhs.path.lexically_normal() &&
         lhs.duration == rhs.duration && lhs.channels == rhs.channels && lhs.samplerate == rhs.samplerate &&
         lhs.time_expansion == rhs.time_expansion && lhs.hash == rhs.hash && lhs.date == rhs.date &&
         lhs.time == rhs.time && lhs.latitude == rhs.latitude && lhs.longitude == rhs.longitude &&
         Equivalent(lhs.tags, rhs.tags) && EquivalentFeatures(lhs.features, rhs.features) &&
         Equivalent(lhs.notes, rhs.notes) && Equivalent(lhs.owners, rhs.owners) && lhs.rights == rhs.rights;
}

bool Equivalent(const Clip& lhs, const Clip& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.recording, rhs.recording) && lhs.start_time == rhs.start_time &&
         lhs.end_time == rhs.end_time && EquivalentFeatures(lhs.features, rhs.features);
}

bool Equivalent(const SoundEvent& lhs, const SoundEvent& rhs) {
  if (lhs.geometry.has_value() != rhs.geometry.has_value()) {
    return false;
  }
  if (lhs.geometry && !google::protobuf::util::MessageDifferencer::Equals(*lhs.geometry, *rhs.geometry)) {
    return false;
  }
  return lhs.uuid == rhs.uuid && Equivalent(lhs.recording, rhs.recording) &&
         EquivalentFeatures(lhs.features, rhs.features);
}

// Walks both parent chains side by side instead of recursing.
bool Equivalent(const Sequence& lhs, const Sequence& rhs) {
  std::set<const Sequence*> visited;

  const Sequence* left  = &lhs;
  const Sequence* right = &rhs;
  while (left && right) {
    if (!visited.insert(left).second) {
      return true;
    }
    if (left != right && !SameSequenceFields(*left, *right)) {
      return false;
    }
    left  = left->parent.get();
    right = right->parent.get();
  }
  return !left && !right;
}

bool Equivalent(const SoundEventAnnotation& lhs, const SoundEventAnnotation& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.sound_event, rhs.sound_event) && Equivalent(lhs.notes, rhs.notes) &&
         Equivalent(lhs.tags, rhs.tags) && Equivalent(lhs.created_by, rhs.created_by) &&
         lhs.created_on == rhs.created_on;
}

bool Equivalent(const SequenceAnnotation& lhs, const SequenceAnnotation& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.sequence, rhs.sequence) && Equivalent(lhs.notes, rhs.notes) &&
         Equivalent(lhs.tags, rhs.tags) && Equivalent(lhs.created_by, rhs.created_by) &&
         lhs.created_on == rhs.created_on;
}

bool Equivalent(const ClipAnnotations& lhs, const ClipAnnotations& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.clip, rhs.clip) && Equivalent(lhs.tags, rhs.tags) &&
         Equivalent(lhs.sound_events, rhs.sound_events) && Equivalent(lhs.sequences, rhs.sequences) &&
         Equivalent(lhs.notes, rhs.notes) && lhs.created_on == rhs.created_on;
}

bool Equivalent(const StatusBadge& lhs, const StatusBadge& rhs) {
  return lhs.state == rhs.state && Equivalent(lhs.owner, rhs.owner) && lhs.created_on == rhs.created_on;
}

bool Equivalent(const AnnotationTask& lhs, const AnnotationTask& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.clip, rhs.clip) && Equivalent(lhs.status_badges, rhs.status_badges) &&
         lhs.created_on == rhs.created_on;
}

bool Equivalent(const SoundEventPrediction& lhs, const SoundEventPrediction& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.sound_event, rhs.sound_event) && lhs.score == rhs.score &&
         Equivalent(lhs.tags, rhs.tags);
}

bool Equivalent(const SequencePrediction& lhs, const SequencePrediction& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.sequence, rhs.sequence) && lhs.score == rhs.score &&
         Equivalent(lhs.tags, rhs.tags);
}

bool Equivalent(const ClipPrediction& lhs, const ClipPrediction& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.clip, rhs.clip) && Equivalent(lhs.sound_events, rhs.sound_events) &&
         Equivalent(lhs.sequences, rhs.sequences) && Equivalent(lhs.tags, rhs.tags) &&
         EquivalentFeatures(lhs.features, rhs.features);
}

bool Equivalent(const Match& lhs, const Match& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.source, rhs.source) && Equivalent(lhs.target, rhs.target) &&
         lhs.affinity == rhs.affinity && lhs.score == rhs.score && EquivalentFeatures(lhs.metrics, rhs.metrics);
}

bool Equivalent(const ClipEvaluation& lhs, const ClipEvaluation& rhs) {
  return lhs.uuid == rhs.uuid && Equivalent(lhs.annotations, rhs.annotations) &&
         Equivalent(lhs.predictions, rhs.predictions) && Equivalent(lhs.matches, rhs.matches) &&
         EquivalentFeatures(lhs.metrics, rhs.metrics) && lhs.score == rhs.score;
}

bool Equivalent(const Collection& lhs, const Collection& rhs) {
  if (typeid(lhs) != typeid(rhs)) {
    return false;
  }

  if (const auto* left = dynamic_cast<const Dataset*>(&lhs)) {
    const auto& right = static_cast<const Dataset&>(rhs);
    return SameRecordingSet(*left, right) && left->name == right.name && left->description == right.description;
  }
  if (const auto* left = dynamic_cast<const RecordingSet*>(&lhs)) {
    return SameRecordingSet(*left, static_cast<const RecordingSet&>(rhs));
  }
  if (const auto* left = dynamic_cast<const AnnotationProject*>(&lhs)) {
    const auto& right = static_cast<const AnnotationProject&>(rhs);
    return SameAnnotationSet(*left, right) && left->name == right.name && left->description == right.description &&
           left->instructions == right.instructions && Equivalent(left->annotation_tags, right.annotation_tags) &&
           Equivalent(left->tasks, right.tasks);
  }
  if (const auto* left = dynamic_cast<const EvaluationSet*>(&lhs)) {
    const auto& right = static_cast<const EvaluationSet&>(rhs);
    return SameAnnotationSet(*left, right) && left->name == right.name && left->description == right.description &&
           Equivalent(left->evaluation_tags, right.evaluation_tags);
  }
  if (const auto* left = dynamic_cast<const AnnotationSet*>(&lhs)) {
    return SameAnnotationSet(*left, static_cast<const AnnotationSet&>(rhs));
  }
  if (const auto* left = dynamic_cast<const ModelRun*>(&lhs)) {
    const auto& right = static_cast<const ModelRun&>(rhs);
    return SamePredictionSet(*left, right) && left->name == right.name && left->version == right.version &&
           left->description == right.description;
  }
  if (const auto* left = dynamic_cast<const PredictionSet*>(&lhs)) {
    return SamePredictionSet(*left, static_cast<const PredictionSet&>(rhs));
  }
  if (const auto* left = dynamic_cast<const Evaluation*>(&lhs)) {
    const auto& right = static_cast<const Evaluation&>(rhs);
    return left->uuid == right.uuid && left->created_on == right.created_on &&
           left->evaluation_task == right.evaluation_task &&
           Equivalent(left->clip_evaluations, right.clip_evaluations) &&
           EquivalentFeatures(left->metrics, right.metrics) && left->score == right.score;
  }

  return lhs.uuid == rhs.uuid && lhs.created_on == rhs.created_on;
}

} // namespace aoef::data
