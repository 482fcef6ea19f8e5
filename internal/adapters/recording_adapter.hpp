#pragma once

#include <filesystem>
#include <optional>

#include "aoef/v1/records.pb.h"
#include "internal/adapters/data_adapter.hpp"
#include "internal/adapters/note_adapter.hpp"
#include "internal/adapters/tag_adapter.hpp"
#include "internal/adapters/user_adapter.hpp"
#include "internal/data/entities.hpp"

namespace aoef::adapters {

/*
  Recording <-> RecordingRecord.

  With an audio directory, paths are written relative to it and joined back
  onto it when read. A recording that lives outside the directory cannot be
  expressed relative to it and is rejected.
*/
class RecordingAdapter : public UuidAdapter<data::Recording, v1::RecordingRecord> {
 public:
  RecordingAdapter(UserAdapter& users, TagAdapter& tags, NoteAdapter& notes,
                   std::optional<std::filesystem::path> audio_dir = std::nullopt);

 protected:
  v1::RecordingRecord AssembleExchange(const data::RecordingPtr& obj, const util::UUID& id) override;
  data::RecordingPtr  AssembleDomain(const v1::RecordingRecord& record) override;

 private:
  std::filesystem::path ExportPath(const std::filesystem::path& path) const;

  UserAdapter&                         users_;
  TagAdapter&                          tags_;
  NoteAdapter&                         notes_;
  std::optional<std::filesystem::path> audio_dir_;
};

} // namespace aoef::adapters
