#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <string>
#include <vector>

#include "aoef/v1/records.pb.h"
#include "internal/data/values.hpp"

namespace aoef::data {

/*
  UUID-identified entities.

  Objects are immutable once shared; edges between them are
  shared_ptr<const T> so a Recording referenced by many Clips exists once.
*/

struct Recording {
  util::UUID                 uuid{};
  std::filesystem::path      path;
  double                     duration       = 0.0;
  std::int32_t               channels       = 1;
  std::int32_t               samplerate     = 0;
  double                     time_expansion = 1.0;
  std::optional<std::string> hash;
  std::optional<std::string> date;  // YYYY-MM-DD
  std::optional<std::string> time;  // HH:MM:SS[.ffffff]
  std::optional<double>      latitude;
  std::optional<double>      longitude;
  std::vector<Tag>           tags;
  Features                   features;
  std::vector<Note>          notes;
  std::vector<User>          owners;
  std::optional<std::string> rights;
};

using RecordingPtr = std::shared_ptr<const Recording>;

struct Clip {
  util::UUID   uuid{};
  RecordingPtr recording;
  double       start_time = 0.0;
  double       end_time   = 0.0;
  Features     features;
};

using ClipPtr = std::shared_ptr<const Clip>;

// Geometry is opaque to the engine and copied verbatim.
using Geometry = aoef::v1::Geometry;

struct SoundEvent {
  util::UUID              uuid{};
  RecordingPtr            recording;
  std::optional<Geometry> geometry;
  Features                features;
};

using SoundEventPtr = std::shared_ptr<const SoundEvent>;

struct Sequence {
  util::UUID                      uuid{};
  std::vector<SoundEventPtr>      sound_events;
  Features                        features;
  std::shared_ptr<const Sequence> parent;

  // Releases the ancestors this node solely owns one at a time, so dropping
  // a long chain does not nest one destructor per link.
  ~Sequence() {
    auto next = std::move(parent);
    while (next && next.use_count() == 1) {
      auto grandparent = next->parent;
      next             = std::move(grandparent);
    }
  }
};

using SequencePtr = std::shared_ptr<const Sequence>;

} // namespace aoef::data
