#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace aoef::util {

/*
  Central error types.

  Every engine failure is raised immediately as one of these. The message
  always embeds the offending id, type or version value.
*/

class AoefError : public std::runtime_error {
 public:
  explicit AoefError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A referenced id does not resolve while importing a document.
*/
class MissingReferenceError : public AoefError {
 public:
  MissingReferenceError(std::string kind, std::string missing_id, std::string referrer)
      : AoefError(kind + " with ID " + missing_id + " not found (referenced by " + referrer + ")"),
        kind_(std::move(kind)),
        missing_id_(std::move(missing_id)),
        referrer_(std::move(referrer)) {
  }

  const std::string& kind() const {
    return kind_;
  }

  const std::string& missing_id() const {
    return missing_id_;
  }

  const std::string& referrer() const {
    return referrer_;
  }

 private:
  std::string kind_;
  std::string missing_id_;
  std::string referrer_;
};

class UnsupportedTypeError : public AoefError {
 public:
  explicit UnsupportedTypeError(const std::string& msg) : AoefError(msg) {
  }
};

class VersionMismatchError : public AoefError {
 public:
  VersionMismatchError(std::string found, std::string expected)
      : AoefError("Invalid AOEF version: " + found + " (expected " + expected + ")"),
        found_(std::move(found)),
        expected_(std::move(expected)) {
  }

  const std::string& found() const {
    return found_;
  }

  const std::string& expected() const {
    return expected_;
  }

 private:
  std::string found_;
  std::string expected_;
};

class MalformedDocumentError : public AoefError {
 public:
  explicit MalformedDocumentError(const std::string& msg) : AoefError(msg) {
  }
};

class CyclicReferenceError : public AoefError {
 public:
  explicit CyclicReferenceError(const std::string& msg) : AoefError(msg) {
  }
};

class InvalidArgument : public AoefError {
 public:
  explicit InvalidArgument(const std::string& msg) : AoefError(msg) {
  }
};

class IoError : public AoefError {
 public:
  explicit IoError(const std::string& msg) : AoefError(msg) {
  }
};

} // namespace aoef::util
