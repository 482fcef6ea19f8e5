#pragma once

#include <string>
#include <utility>

#include "aoef/v1/document.pb.h"

namespace aoef::io {

/*
  Outcome of the JSON boundary checks.

  Parsing and validation report problems as codes so callers such as the
  CLI can decide how to surface them; Load() turns them into exceptions.
*/

enum class ParseCode {
  OK = 0,

  InvalidJson,
  VersionMismatch,
  Malformed,
};

struct ParseResult {
  ParseCode   code = ParseCode::OK;
  std::string message;

  // Version string found in the envelope, when there was one.
  std::string version;

  v1::Document document;

  static ParseResult Ok(v1::Document doc) {
    ParseResult result;
    result.version  = doc.version();
    result.document = std::move(doc);
    return result;
  }

  static ParseResult Err(ParseCode c, std::string msg = {}) {
    ParseResult result;
    result.code    = c;
    result.message = std::move(msg);
    return result;
  }

  explicit operator bool() const {
    return code == ParseCode::OK;
  }
};

} // namespace aoef::io
