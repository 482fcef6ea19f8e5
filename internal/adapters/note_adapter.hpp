#pragma once

#include <string>

#include "aoef/v1/records.pb.h"
#include "internal/adapters/user_adapter.hpp"
#include "internal/data/values.hpp"

namespace aoef::adapters {

/*
  Notes are embedded in their owner's record, so there is no identity map
  here; the only reference a note holds is its author.
*/
class NoteAdapter {
 public:
  explicit NoteAdapter(UserAdapter& users);

  v1::NoteRecord ToExchange(const data::Note& note);

  // `referrer` names the record that embeds the note, for error messages.
  data::Note ToDomain(const v1::NoteRecord& record, const std::string& referrer);

 private:
  UserAdapter& users_;
};

} // namespace aoef::adapters
