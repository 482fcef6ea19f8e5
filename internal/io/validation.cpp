#include "internal/io/validation.hpp"

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aoef::io {

namespace {

// Keeps the first problem found; later checks become no-ops.
class Checker {
 public:
  bool ok() const {
    return error_.empty();
  }

  const std::string& error() const {
    return error_;
  }

  void Require(bool condition, const std::string& what) {
    if (ok() && !condition) error_ = what;
  }

  void Uuid(const std::string& text, const std::string& what) {
    Require(util::TryFromString(text).has_value(), "invalid uuid '" + text + "' in " + what);
  }

  // Runs `parse` on a present field and records its MalformedDocumentError.
  template <typename Parse>
  void Format(bool present, const std::string& text, const std::string& what, Parse parse) {
    if (!ok() || !present) return;
    try {
      parse(text);
    } catch (const util::MalformedDocumentError& e) {
      error_ = what + ": " + e.what();
    }
  }

  void Timestamp(bool present, const std::string& text, const std::string& what) {
    Format(present, text, what, [](const std::string& t) { (void)util::FromIso8601(t); });
  }

 private:
  std::string error_;
};

std::string Name(std::string_view kind, const std::string& uuid) {
  return std::string(kind) + " " + uuid;
}

void CheckNotes(Checker& check, const google::protobuf::RepeatedPtrField<v1::NoteRecord>& notes,
                const std::string& owner) {
  for (const auto& note : notes) {
    const auto self = "note of " + owner;
    check.Uuid(note.uuid(), self);
    check.Timestamp(note.has_created_on(), note.created_on(), self);
  }
}

void CheckLeaves(Checker& check, const v1::CollectionRecord& record) {
  for (const auto& user : record.users()) {
    check.Require(user.has_id(), "user record without id");
    check.Uuid(user.uuid(), "user " + std::to_string(user.id()));
  }
  for (const auto& tag : record.tags()) {
    check.Require(tag.has_id(), "tag record without id (" + tag.key() + "=" + tag.value() + ")");
  }
}

void CheckRecordings(Checker& check, const v1::CollectionRecord& record) {
  for (const auto& recording : record.recordings()) {
    const auto self = Name("recording", recording.uuid());
    check.Uuid(recording.uuid(), self);
    check.Require(!recording.path().empty(), self + " has no path");
    check.Require(recording.has_duration(), self + " has no duration");
    check.Require(recording.has_channels(), self + " has no channels");
    check.Require(recording.has_samplerate(), self + " has no samplerate");
    check.Format(recording.has_date(), recording.date(), self + " date", util::CheckIsoDate);
    check.Format(recording.has_time(), recording.time(), self + " time", util::CheckIsoTime);
    CheckNotes(check, recording.notes(), self);
  }
}

void CheckEntities(Checker& check, const v1::CollectionRecord& record) {
  for (const auto& clip : record.clips()) {
    const auto self = Name("clip", clip.uuid());
    check.Uuid(clip.uuid(), self);
    check.Require(!clip.recording().empty(), self + " has no recording");
    check.Require(clip.has_start_time() && clip.has_end_time(), self + " has no time bounds");
  }
  for (const auto& sound_event : record.sound_events()) {
    const auto self = Name("sound event", sound_event.uuid());
    check.Uuid(sound_event.uuid(), self);
    check.Require(!sound_event.recording().empty(), self + " has no recording");
  }
  for (const auto& sequence : record.sequences()) {
    check.Uuid(sequence.uuid(), Name("sequence", sequence.uuid()));
  }
}

void CheckAnnotations(Checker& check, const v1::CollectionRecord& record) {
  for (const auto& annotation : record.sound_event_annotations()) {
    const auto self = Name("sound event annotation", annotation.uuid());
    check.Uuid(annotation.uuid(), self);
    check.Require(!annotation.sound_event().empty(), self + " has no sound_event");
    check.Timestamp(annotation.has_created_on(), annotation.created_on(), self);
    CheckNotes(check, annotation.notes(), self);
  }
  for (const auto& annotation : record.sequence_annotations()) {
    const auto self = Name("sequence annotation", annotation.uuid());
    check.Uuid(annotation.uuid(), self);
    check.Require(!annotation.sequence().empty(), self + " has no sequence");
    check.Timestamp(annotation.has_created_on(), annotation.created_on(), self);
    CheckNotes(check, annotation.notes(), self);
  }
  for (const auto& annotations : record.clip_annotations()) {
    const auto self = Name("clip annotations", annotations.uuid());
    check.Uuid(annotations.uuid(), self);
    check.Require(!annotations.clip().empty(), self + " has no clip");
    check.Timestamp(annotations.has_created_on(), annotations.created_on(), self);
    CheckNotes(check, annotations.notes(), self);
  }
  for (const auto& task : record.tasks()) {
    const auto self = Name("annotation task", task.uuid());
    check.Uuid(task.uuid(), self);
    check.Require(!task.clip().empty(), self + " has no clip");
    check.Timestamp(task.has_created_on(), task.created_on(), self);
    for (const auto& badge : task.status_badges()) {
      check.Require(!badge.state().empty(), "status badge without state in " + self);
      check.Timestamp(badge.has_created_on(), badge.created_on(), "status badge of " + self);
    }
  }
}

void CheckPredictions(Checker& check, const v1::CollectionRecord& record) {
  for (const auto& prediction : record.sound_event_predictions()) {
    const auto self = Name("sound event prediction", prediction.uuid());
    check.Uuid(prediction.uuid(), self);
    check.Require(!prediction.sound_event().empty(), self + " has no sound_event");
    check.Require(prediction.has_score(), self + " has no score");
  }
  for (const auto& prediction : record.sequence_predictions()) {
    const auto self = Name("sequence prediction", prediction.uuid());
    check.Uuid(prediction.uuid(), self);
    check.Require(!prediction.sequence().empty(), self + " has no sequence");
    check.Require(prediction.has_score(), self + " has no score");
  }
  for (const auto& predictions : record.clip_predictions()) {
    const auto self = Name("clip predictions", predictions.uuid());
    check.Uuid(predictions.uuid(), self);
    check.Require(!predictions.clip().empty(), self + " has no clip");
  }
}

void CheckEvaluations(Checker& check, const v1::CollectionRecord& record) {
  for (const auto& match : record.matches()) {
    const auto self = Name("match", match.uuid());
    check.Uuid(match.uuid(), self);
    check.Require(match.has_affinity(), self + " has no affinity");
  }
  for (const auto& evaluation : record.clip_evaluations()) {
    const auto self = Name("clip evaluation", evaluation.uuid());
    check.Uuid(evaluation.uuid(), self);
    check.Require(!evaluation.annotations().empty(), self + " has no annotations");
    check.Require(!evaluation.predictions().empty(), self + " has no predictions");
  }
}

} // namespace

ParseResult ValidateCollection(const v1::CollectionRecord& record, collections::CollectionKind kind) {
  using collections::CollectionKind;

  Checker    check;
  const auto self = Name(collections::ToString(kind), record.uuid());

  check.Uuid(record.uuid(), self);
  check.Timestamp(record.has_created_on(), record.created_on(), self);

  switch (kind) {
    case CollectionKind::kDataset:
    case CollectionKind::kAnnotationProject:
    case CollectionKind::kEvaluationSet:
    case CollectionKind::kModelRun:
      check.Require(record.has_name(), self + " has no name");
      break;
    case CollectionKind::kEvaluation:
      check.Require(record.has_evaluation_task(), self + " has no evaluation_task");
      break;
    default:
      break;
  }

  CheckLeaves(check, record);
  CheckRecordings(check, record);
  CheckEntities(check, record);
  CheckAnnotations(check, record);
  CheckPredictions(check, record);
  CheckEvaluations(check, record);

  if (!check.ok()) {
    return ParseResult::Err(ParseCode::Malformed, check.error());
  }
  return ParseResult::Ok(v1::Document{});
}

ParseResult ValidateEnvelope(const v1::Document& doc) {
  Checker check;
  check.Timestamp(!doc.created_on().empty(), doc.created_on(), "document created_on");

  if (!check.ok()) {
    return ParseResult::Err(ParseCode::Malformed, check.error());
  }
  return ParseResult::Ok(v1::Document{});
}

} // namespace aoef::io
