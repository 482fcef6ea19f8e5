#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aoef::data {

// Content-identified values. These are held by value wherever they appear.

struct Tag {
  std::string key;
  std::string value;
};

struct Feature {
  std::string name;
  double      value = 0.0;
};

using Features = std::vector<Feature>;

struct PredictedTag {
  Tag    tag;
  double score = 0.0;
};

struct User {
  util::UUID                 uuid{};
  std::optional<std::string> username;
  std::optional<std::string> email;
  std::optional<std::string> name;
  std::optional<std::string> institution;
};

struct Note {
  util::UUID          uuid{};
  std::string         message;
  std::optional<User> created_by;
  bool                is_issue = false;
  util::TimePoint     created_on{};
};

inline Tag MakeTag(std::string key, std::string value) {
  return Tag{std::move(key), std::move(value)};
}

inline User MakeUser(std::optional<std::string> username = std::nullopt) {
  User user;
  user.uuid     = util::GenerateUUID();
  user.username = std::move(username);
  return user;
}

inline Note MakeNote(std::string message, std::optional<User> created_by = std::nullopt) {
  Note note;
  note.uuid       = util::GenerateUUID();
  note.message    = std::move(message);
  note.created_by = std::move(created_by);
  note.created_on = util::Now();
  return note;
}

} // namespace aoef::data
