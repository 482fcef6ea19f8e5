#include "internal/adapters/note_adapter.hpp"

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

NoteAdapter::NoteAdapter(UserAdapter& users) : users_(users) {
}

v1::NoteRecord NoteAdapter::ToExchange(const data::Note& note) {
  v1::NoteRecord record;
  record.set_uuid(util::ToString(note.uuid));
  record.set_message(note.message);
  if (note.created_by) {
    record.set_created_by(users_.ToExchange(*note.created_by).id());
  }
  if (note.is_issue) {
    record.set_is_issue(true);
  }
  record.set_created_on(util::ToIso8601(note.created_on));
  return record;
}

data::Note NoteAdapter::ToDomain(const v1::NoteRecord& record, const std::string& referrer) {
  const std::string self = "note " + record.uuid() + " of " + referrer;

  data::Note note;
  note.uuid    = ParseUuid(record.uuid(), self);
  note.message = record.message();
  if (record.has_created_by()) {
    note.created_by = Resolve(users_, record.created_by(), "User", self);
  }
  note.is_issue   = record.is_issue();
  note.created_on = ParseTimestampOr(record.has_created_on(), record.created_on(), util::Now());
  return note;
}

} // namespace aoef::adapters
