#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/data/collections.hpp"

namespace aoef::collections {

enum class CollectionKind : std::uint8_t {
  kEvaluation        = 0,
  kDataset           = 1,
  kAnnotationProject = 2,
  kEvaluationSet     = 3,
  kModelRun          = 4,
  kAnnotationSet     = 5,
  kPredictionSet     = 6,
  kRecordingSet      = 7,
};

/*
  Order in which kinds are tried against a runtime object. The first kind
  the object is an instance of wins, so every derived kind has to be listed
  before the kind it extends.
*/
inline constexpr std::array<CollectionKind, 8> kDispatchOrder = {
    CollectionKind::kEvaluation,    CollectionKind::kDataset,       CollectionKind::kAnnotationProject,
    CollectionKind::kEvaluationSet, CollectionKind::kModelRun,      CollectionKind::kAnnotationSet,
    CollectionKind::kPredictionSet, CollectionKind::kRecordingSet,
};

// The kind a kind extends, if any.
constexpr std::optional<CollectionKind> BaseKind(CollectionKind kind) {
  switch (kind) {
    case CollectionKind::kDataset:
      return CollectionKind::kRecordingSet;
    case CollectionKind::kAnnotationProject:
    case CollectionKind::kEvaluationSet:
      return CollectionKind::kAnnotationSet;
    case CollectionKind::kModelRun:
      return CollectionKind::kPredictionSet;
    default:
      return std::nullopt;
  }
}

constexpr std::size_t DispatchIndex(CollectionKind kind) {
  for (std::size_t i = 0; i < kDispatchOrder.size(); ++i) {
    if (kDispatchOrder[i] == kind) return i;
  }
  return kDispatchOrder.size();
}

constexpr bool DerivedKindsPrecedeBases() {
  for (auto kind : kDispatchOrder) {
    auto base = BaseKind(kind);
    if (base && DispatchIndex(kind) >= DispatchIndex(*base)) return false;
  }
  return true;
}

static_assert(DerivedKindsPrecedeBases(), "kDispatchOrder must list derived kinds before their bases");
static_assert(DispatchIndex(CollectionKind::kRecordingSet) < kDispatchOrder.size());

std::string_view              ToString(CollectionKind kind);
std::optional<CollectionKind> ParseCollectionKind(std::string_view text);

// Whether `obj` is an instance of the kind's type (derived types included).
bool Matches(CollectionKind kind, const data::Collection& obj);

// First kind in dispatch order that `obj` matches.
std::optional<CollectionKind> KindOf(const data::Collection& obj);

} // namespace aoef::collections
