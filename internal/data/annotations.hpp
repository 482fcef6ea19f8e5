#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/data/entities.hpp"

namespace aoef::data {

struct SoundEventAnnotation {
  util::UUID          uuid{};
  SoundEventPtr       sound_event;
  std::vector<Note>   notes;
  std::vector<Tag>    tags;
  std::optional<User> created_by;
  util::TimePoint     created_on{};
};

using SoundEventAnnotationPtr = std::shared_ptr<const SoundEventAnnotation>;

struct SequenceAnnotation {
  util::UUID          uuid{};
  SequencePtr         sequence;
  std::vector<Note>   notes;
  std::vector<Tag>    tags;
  std::optional<User> created_by;
  util::TimePoint     created_on{};
};

using SequenceAnnotationPtr = std::shared_ptr<const SequenceAnnotation>;

struct ClipAnnotations {
  util::UUID                           uuid{};
  ClipPtr                              clip;
  std::vector<Tag>                     tags;
  std::vector<SoundEventAnnotationPtr> sound_events;
  std::vector<SequenceAnnotationPtr>   sequences;
  std::vector<Note>                    notes;
  util::TimePoint                      created_on{};
};

using ClipAnnotationsPtr = std::shared_ptr<const ClipAnnotations>;

enum class AnnotationState : std::uint8_t {
  kAssigned  = 0,
  kCompleted = 1,
  kVerified  = 2,
  kRejected  = 3,
};

constexpr std::string_view ToString(AnnotationState state) {
  switch (state) {
    case AnnotationState::kAssigned:
      return "assigned";
    case AnnotationState::kCompleted:
      return "completed";
    case AnnotationState::kVerified:
      return "verified";
    case AnnotationState::kRejected:
      return "rejected";
  }
  return "assigned";
}

inline std::optional<AnnotationState> ParseAnnotationState(std::string_view text) {
  for (auto state : {AnnotationState::kAssigned, AnnotationState::kCompleted, AnnotationState::kVerified,
                     AnnotationState::kRejected}) {
    if (ToString(state) == text) {
      return state;
    }
  }
  return std::nullopt;
}

struct StatusBadge {
  AnnotationState     state = AnnotationState::kAssigned;
  std::optional<User> owner;
  util::TimePoint     created_on{};
};

struct AnnotationTask {
  util::UUID               uuid{};
  ClipPtr                  clip;
  std::vector<StatusBadge> status_badges;
  util::TimePoint          created_on{};
};

using AnnotationTaskPtr = std::shared_ptr<const AnnotationTask>;

} // namespace aoef::data
