#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "api/aoef/v1.hpp"
#include "internal/data/equivalence.hpp"

using namespace aoef::api::v1;

int main(int argc, char** argv) {
  // Allow overriding the output location for sandboxed runs.
  const std::filesystem::path out =
      argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::temp_directory_path() / "aoef_example.json";

  auto annotator = MakeUser("annotator");

  auto recording        = std::make_shared<Recording>();
  recording->uuid       = aoef::util::GenerateUUID();
  recording->path       = "site_a/2024-05-01_0600.wav";
  recording->duration   = 60.0;
  recording->samplerate = 48000;
  recording->tags       = {MakeTag("site", "a")};

  auto clip        = std::make_shared<Clip>();
  clip->uuid       = aoef::util::GenerateUUID();
  clip->recording  = recording;
  clip->start_time = 0.0;
  clip->end_time   = 10.0;

  auto sound_event       = std::make_shared<SoundEvent>();
  sound_event->uuid      = aoef::util::GenerateUUID();
  sound_event->recording = recording;

  auto annotation         = std::make_shared<SoundEventAnnotation>();
  annotation->uuid        = aoef::util::GenerateUUID();
  annotation->sound_event = sound_event;
  annotation->tags        = {MakeTag("species", "dog")};
  annotation->created_by  = annotator;
  annotation->created_on  = aoef::util::Now();

  auto clip_annotations          = std::make_shared<ClipAnnotations>();
  clip_annotations->uuid         = aoef::util::GenerateUUID();
  clip_annotations->clip         = clip;
  clip_annotations->sound_events = {annotation};
  clip_annotations->notes        = {MakeNote("two barks, second one faint", annotator)};
  clip_annotations->created_on   = aoef::util::Now();

  AnnotationSet set;
  set.uuid             = aoef::util::GenerateUUID();
  set.created_on       = aoef::util::Now();
  set.clip_annotations = {clip_annotations};

  try {
    Save(set, out, {std::nullopt, true});
    auto loaded = LoadAs<AnnotationSet>(out);

    std::cout << "Saved and reloaded annotation set " << aoef::util::ToString(loaded->uuid) << " from " << out
              << '\n';
    std::cout << "Equivalent after round trip: " << (aoef::data::Equivalent(set, *loaded) ? "yes" : "no") << '\n';
  } catch (const AoefError& e) {
    std::cerr << "round trip failed: " << e.what() << '\n';
    return 1;
  }

  return 0;
}
