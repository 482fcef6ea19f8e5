#include "factory.hpp"

namespace aoef::factory {

AdapterTree::AdapterTree(const AdapterOptions& options)
    : users(),
      tags(),
      notes(users),
      recordings(users, tags, notes, options.audio_dir),
      clips(recordings),
      sound_events(recordings),
      sequences(sound_events),
      sound_event_annotations(users, tags, notes, sound_events),
      sequence_annotations(users, tags, notes, sequences),
      clip_annotations(clips, tags, notes, sound_event_annotations, sequence_annotations),
      sound_event_predictions(sound_events, tags),
      sequence_predictions(sequences, tags),
      clip_predictions(clips, sound_event_predictions, sequence_predictions, tags),
      matches(sound_event_annotations, sound_event_predictions),
      clip_evaluations(clip_annotations, clip_predictions, matches),
      tasks(clips, users) {
}

std::unique_ptr<AdapterTree> BuildAdapterTree(const AdapterOptions& options) {
  return std::make_unique<AdapterTree>(options);
}

} // namespace aoef::factory
