#pragma once

#include "aoef/v1/document.pb.h"
#include "internal/collections/collection_kind.hpp"
#include "internal/io/parse_result.hpp"

namespace aoef::io {

/*
  Shape checks run on a parsed collection before any adapter sees it:
  required fields present, uuids well formed, timestamps parseable, and the
  kind's own required header fields set. Reference resolution is left to
  import, which reports the missing id.
*/
ParseResult ValidateCollection(const v1::CollectionRecord& record, collections::CollectionKind kind);

// The envelope's own fields: created_on, when set, must be an ISO-8601
// datetime.
ParseResult ValidateEnvelope(const v1::Document& doc);

} // namespace aoef::io
