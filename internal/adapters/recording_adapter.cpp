#include "internal/adapters/recording_adapter.hpp"

#include <memory>

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

RecordingAdapter::RecordingAdapter(UserAdapter& users, TagAdapter& tags, NoteAdapter& notes,
                                   std::optional<std::filesystem::path> audio_dir)
    : UuidAdapter("Recording"), users_(users), tags_(tags), notes_(notes), audio_dir_(std::move(audio_dir)) {
}

std::filesystem::path RecordingAdapter::ExportPath(const std::filesystem::path& path) const {
  if (!audio_dir_) {
    return path;
  }

  const auto base     = audio_dir_->lexically_normal();
  const auto relative = path.lexically_normal().lexically_relative(base);
  if (relative.empty() || *relative.begin() == "..") {
    throw util::InvalidArgument("Recording path '" + path.string() + "' is not inside audio directory '" +
                                audio_dir_->string() + "'");
  }
  return relative;
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

v1::RecordingRecord RecordingAdapter::AssembleExchange(const data::RecordingPtr& obj, const util::UUID& id) {
  v1::RecordingRecord record;
  record.set_uuid(util::ToString(id));
  record.set_path(ExportPath(obj->path).generic_string());
  record.set_duration(obj->duration);
  record.set_channels(obj->channels);
  record.set_samplerate(obj->samplerate);
  if (obj->time_expansion != 1.0) {
    record.set_time_expansion(obj->time_expansion);
  }
  if (obj->hash) record.set_hash(*obj->hash);
  if (obj->date) record.set_date(*obj->date);
  if (obj->time) record.set_time(*obj->time);
  if (obj->latitude) record.set_latitude(*obj->latitude);
  if (obj->longitude) record.set_longitude(*obj->longitude);

  for (const auto& tag : obj->tags) {
    record.add_tags(tags_.ToExchange(tag).id());
  }
  ExportFeatures(obj->features, record.mutable_features());
  for (const auto& note : obj->notes) {
    *record.add_notes() = notes_.ToExchange(note);
  }
  for (const auto& owner : obj->owners) {
    record.add_owners(users_.ToExchange(owner).id());
  }
  if (obj->rights) record.set_rights(*obj->rights);

  return record;
}

// ------------------------------------------------------------
// Import
// ------------------------------------------------------------

data::RecordingPtr RecordingAdapter::AssembleDomain(const v1::RecordingRecord& record) {
  const auto self = Describe("recording", record.uuid());

  auto recording  = std::make_shared<data::Recording>();
  recording->uuid = ParseUuid(record.uuid(), self);
  recording->path = audio_dir_ ? *audio_dir_ / record.path() : std::filesystem::path(record.path());
  recording->duration       = record.duration();
  recording->channels       = record.channels();
  recording->samplerate     = record.samplerate();
  recording->time_expansion = record.has_time_expansion() ? record.time_expansion() : 1.0;
  if (record.has_hash()) recording->hash = record.hash();
  if (record.has_date()) recording->date = record.date();
  if (record.has_time()) recording->time = record.time();
  if (record.has_latitude()) recording->latitude = record.latitude();
  if (record.has_longitude()) recording->longitude = record.longitude();

  for (auto tag_id : record.tags()) {
    recording->tags.push_back(Resolve(tags_, tag_id, "Tag", self));
  }
  recording->features = ImportFeatures(record.features());
  for (const auto& note : record.notes()) {
    recording->notes.push_back(notes_.ToDomain(note, self));
  }
  for (auto owner_id : record.owners()) {
    recording->owners.push_back(Resolve(users_, owner_id, "User", self));
  }
  if (record.has_rights()) recording->rights = record.rights();

  return recording;
}

} // namespace aoef::adapters
