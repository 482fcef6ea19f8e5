#pragma once

#include "aoef/v1/document.pb.h"
#include "aoef/v1/records.pb.h"

#include "internal/collections/collection_kind.hpp"
#include "internal/data/annotations.hpp"
#include "internal/data/collections.hpp"
#include "internal/data/entities.hpp"
#include "internal/data/evaluations.hpp"
#include "internal/data/predictions.hpp"
#include "internal/data/values.hpp"
#include "internal/io/document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aoef::api::v1 {
using namespace ::aoef::data;
using namespace ::aoef::io;
using ::aoef::collections::CollectionKind;
using ::aoef::util::AoefError;
using ::aoef::util::CyclicReferenceError;
using ::aoef::util::InvalidArgument;
using ::aoef::util::IoError;
using ::aoef::util::MalformedDocumentError;
using ::aoef::util::MissingReferenceError;
using ::aoef::util::UnsupportedTypeError;
using ::aoef::util::VersionMismatchError;
} // namespace aoef::api::v1
