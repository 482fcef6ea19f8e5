#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "aoef/v1/document.pb.h"
#include "internal/collections/collection_kind.hpp"
#include "internal/data/collections.hpp"
#include "internal/io/parse_result.hpp"
#include "internal/util/errors.hpp"

namespace aoef::io {

/*
  Document envelope: {version, created_on, data}.

  The only place the engine touches files. A load accepts exactly
  kAoefVersion; anything else is rejected before the body is looked at.
*/

inline constexpr std::string_view kAoefVersion = "1.1.0";

struct SaveOptions {
  std::optional<std::filesystem::path> audio_dir;
  bool                                 pretty = false;
};

struct LoadOptions {
  std::optional<std::filesystem::path>       audio_dir;
  std::optional<collections::CollectionKind> expected_kind;
};

// ------------------------------------------------------------
// In-memory conversions
// ------------------------------------------------------------

// Throws UnsupportedTypeError when no collection kind matches `obj`.
v1::Document ToDocument(const data::Collection&                    obj,
                        const std::optional<std::filesystem::path>& audio_dir = std::nullopt);

std::shared_ptr<data::Collection> FromDocument(const v1::Document& doc, const LoadOptions& options = {});

std::string Serialize(const v1::Document& doc, bool pretty = false);

// JSON -> envelope. Checks the JSON syntax and the version before the body
// is decoded, so a foreign version is reported as such whatever it contains.
ParseResult ParseDocument(const std::string& json);

// Throws the exception matching a failed ParseResult.
[[noreturn]] void ThrowParseError(const ParseResult& result);

// ------------------------------------------------------------
// Files
// ------------------------------------------------------------

// Creates missing parent directories.
void Save(const data::Collection& obj, const std::filesystem::path& path, const SaveOptions& options = {});

// Reads and parses the envelope without importing the collection.
v1::Document ReadDocument(const std::filesystem::path& path);

std::shared_ptr<data::Collection> Load(const std::filesystem::path& path, const LoadOptions& options = {});

template <typename T>
std::shared_ptr<T> LoadAs(const std::filesystem::path& path, LoadOptions options = {}) {
  auto collection = Load(path, options);
  auto typed      = std::dynamic_pointer_cast<T>(collection);
  if (!typed) {
    throw util::UnsupportedTypeError("Document at " + path.string() + " does not hold the requested collection type");
  }
  return typed;
}

// Per-list record counts of a collection, in schema order, empty lists skipped.
std::vector<std::pair<std::string, int>> RecordCounts(const v1::CollectionRecord& record);

} // namespace aoef::io
