#include <cassert>
#include <iostream>
#include <string>

#include "internal/adapters/note_adapter.hpp"
#include "internal/adapters/tag_adapter.hpp"
#include "internal/adapters/user_adapter.hpp"
#include "internal/data/equivalence.hpp"
#include "internal/util/errors.hpp"

namespace {

using aoef::data::MakeNote;
using aoef::data::MakeTag;
using aoef::data::MakeUser;

void TestTagsNumberedInFirstSeenOrder() {
  aoef::adapters::TagAdapter tags;

  assert(tags.ToExchange(MakeTag("species", "dog")).id() == 0);
  assert(tags.ToExchange(MakeTag("species", "cat")).id() == 1);
  assert(tags.ToExchange(MakeTag("species", "dog")).id() == 0);
  assert(tags.ToExchange(MakeTag("call", "dog")).id() == 2);

  const auto& values = tags.Values();
  assert(values.size() == 3);
  assert(values[0].key() == "species" && values[0].value() == "dog");
  assert(values[2].key() == "call");
}

void TestTagImportKeepsDocumentIds() {
  aoef::adapters::TagAdapter tags;

  aoef::v1::TagRecord record;
  record.set_id(41);
  record.set_key("species");
  record.set_value("dog");

  const auto& tag = tags.ToDomain(record);
  assert(tag.key == "species" && tag.value == "dog");
  assert(tags.FromId(41) != nullptr);
  assert(tags.FromId(0) == nullptr);
}

void TestUsersDeduplicatedOnContent() {
  aoef::adapters::UserAdapter users;

  auto alice       = MakeUser("alice");
  auto alice_again = alice;
  auto renamed     = alice;
  renamed.email    = "alice@example.org";

  assert(users.ToExchange(alice).id() == 0);
  assert(users.ToExchange(alice_again).id() == 0);
  assert(users.ToExchange(renamed).id() == 1);

  const auto& record = users.Values()[0];
  assert(record.uuid() == aoef::util::ToString(alice.uuid));
  assert(record.username() == "alice");
  assert(!record.has_email());
}

void TestUserRoundTrip() {
  aoef::adapters::UserAdapter out;
  auto                        user = MakeUser("bob");
  user.institution                 = "Field Station";

  const auto record = out.ToExchange(user);

  aoef::adapters::UserAdapter in;
  assert(aoef::data::Equivalent(in.ToDomain(record), user));
}

void TestNoteAuthorsBecomeUserIds() {
  aoef::adapters::UserAdapter users;
  aoef::adapters::NoteAdapter notes(users);

  auto author = MakeUser("carol");
  auto note   = MakeNote("faint call", author);
  note.is_issue = true;

  const auto record = notes.ToExchange(note);
  assert(record.has_created_by());
  assert(record.created_by() == 0);
  assert(record.is_issue());
  assert(users.Values().size() == 1);

  aoef::adapters::UserAdapter in_users;
  aoef::adapters::NoteAdapter in_notes(in_users);
  for (const auto& user : users.Values()) {
    in_users.ToDomain(user);
  }
  assert(aoef::data::Equivalent(in_notes.ToDomain(record, "recording x"), note));
}

void TestNoteWithUnknownAuthorFails() {
  aoef::adapters::UserAdapter users;
  aoef::adapters::NoteAdapter notes(users);

  aoef::v1::NoteRecord record;
  record.set_uuid(aoef::util::ToString(aoef::util::GenerateUUID()));
  record.set_message("orphan");
  record.set_created_by(9);

  bool threw = false;
  try {
    (void)notes.ToDomain(record, "recording x");
  } catch (const aoef::util::MissingReferenceError& e) {
    threw = true;
    assert(e.kind() == "User");
    assert(e.missing_id() == "9");
  }
  assert(threw);
}

} // namespace

int main() {
  TestTagsNumberedInFirstSeenOrder();
  TestTagImportKeepsDocumentIds();
  TestUsersDeduplicatedOnContent();
  TestUserRoundTrip();
  TestNoteAuthorsBecomeUserIds();
  TestNoteWithUnknownAuthorFails();

  std::cout << "aoef_unit_leaf_adapter: pass\n";
  return 0;
}
