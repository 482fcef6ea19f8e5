#include "internal/io/document.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <typeinfo>

#include "internal/collections/collection_adapter.hpp"
#include "internal/io/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace aoef::io {

namespace {

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;
using google::protobuf::util::JsonStringToMessage;
using google::protobuf::util::MessageToJsonString;

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::IoError("Cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::IoError("Failed reading " + path.string());
  }
  return buffer.str();
}

void WriteFile(const std::filesystem::path& path, const std::string& text) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw util::IoError("Cannot create " + path.parent_path().string() + ": " + ec.message());
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::IoError("Cannot open " + path.string() + " for writing");
  }
  out << text;
  out.flush();
  if (!out) {
    throw util::IoError("Failed writing " + path.string());
  }
}

std::int64_t TotalRecords(const v1::CollectionRecord& record) {
  std::int64_t total = 0;
  for (const auto& [list, count] : RecordCounts(record)) {
    total += count;
  }
  return total;
}

} // namespace

v1::Document ToDocument(const data::Collection& obj, const std::optional<std::filesystem::path>& audio_dir) {
  const auto kind = collections::KindOf(obj);
  if (!kind) {
    throw util::UnsupportedTypeError(std::string("Unsupported collection type: ") + typeid(obj).name());
  }

  v1::Document doc;
  doc.set_version(std::string(kAoefVersion));
  doc.set_created_on(util::ToIso8601(util::Now()));
  *doc.mutable_data() = collections::MakeCollectionAdapter(*kind, {audio_dir})->Export(obj);
  return doc;
}

std::shared_ptr<data::Collection> FromDocument(const v1::Document& doc, const LoadOptions& options) {
  if (doc.version() != kAoefVersion) {
    throw util::VersionMismatchError(doc.version(), std::string(kAoefVersion));
  }
  if (auto envelope = ValidateEnvelope(doc); !envelope) {
    ThrowParseError(envelope);
  }

  const auto& record = doc.data();
  const auto  kind   = collections::ParseCollectionKind(record.collection_type());
  if (!kind) {
    throw util::UnsupportedTypeError("Unsupported collection type: " + record.collection_type());
  }
  if (options.expected_kind && *options.expected_kind != *kind) {
    throw util::UnsupportedTypeError("Expected a " + std::string(collections::ToString(*options.expected_kind)) +
                                     " document, found " + record.collection_type());
  }

  auto checked = ValidateCollection(record, *kind);
  if (!checked) {
    ThrowParseError(checked);
  }

  return collections::MakeCollectionAdapter(*kind, {options.audio_dir})->Import(record);
}

std::string Serialize(const v1::Document& doc, bool pretty) {
  JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = MessageToJsonString(doc, &out, options);
  if (!status.ok()) {
    throw util::MalformedDocumentError("Cannot encode document: " + status.ToString());
  }
  return out;
}

ParseResult ParseDocument(const std::string& json) {
  // Generic pass first: syntax and version, independent of the schema.
  google::protobuf::Struct envelope;
  auto                     status = JsonStringToMessage(json, &envelope);
  if (!status.ok()) {
    return ParseResult::Err(ParseCode::InvalidJson, "Invalid JSON: " + status.ToString());
  }

  const auto& fields  = envelope.fields();
  auto        version = fields.find("version");
  if (version == fields.end() || version->second.kind_case() != google::protobuf::Value::kStringValue) {
    return ParseResult::Err(ParseCode::Malformed, "Document has no version string");
  }
  if (version->second.string_value() != kAoefVersion) {
    auto result    = ParseResult::Err(ParseCode::VersionMismatch, "Invalid AOEF version: " +
                                                                    version->second.string_value());
    result.version = version->second.string_value();
    return result;
  }
  if (fields.find("data") == fields.end()) {
    return ParseResult::Err(ParseCode::Malformed, "Document has no data");
  }

  JsonParseOptions options;
  options.ignore_unknown_fields = true;

  v1::Document doc;
  status = JsonStringToMessage(json, &doc, options);
  if (!status.ok()) {
    return ParseResult::Err(ParseCode::Malformed, "Malformed document: " + status.ToString());
  }
  return ParseResult::Ok(std::move(doc));
}

void ThrowParseError(const ParseResult& result) {
  switch (result.code) {
    case ParseCode::VersionMismatch:
      throw util::VersionMismatchError(result.version, std::string(kAoefVersion));
    case ParseCode::InvalidJson:
    case ParseCode::Malformed:
      throw util::MalformedDocumentError(result.message);
    case ParseCode::OK:
      break;
  }
  throw util::InvalidArgument("ThrowParseError called on a successful result");
}

void Save(const data::Collection& obj, const std::filesystem::path& path, const SaveOptions& options) {
  auto doc  = ToDocument(obj, options.audio_dir);
  auto text = Serialize(doc, options.pretty);
  WriteFile(path, text);

  AOEF_LOG_DEBUG("saved document", {observability::PathField("path", path),
                                    observability::StringField("collection_type", doc.data().collection_type()),
                                    observability::IntField("records", TotalRecords(doc.data())),
                                    observability::IntField("bytes", static_cast<std::int64_t>(text.size()))});
}

v1::Document ReadDocument(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw util::IoError("File not found: " + path.string());
  }
  if (path.extension() != ".json") {
    throw util::InvalidArgument("Not a JSON file: " + path.string());
  }

  auto parsed = ParseDocument(ReadFile(path));
  if (!parsed) {
    ThrowParseError(parsed);
  }
  return std::move(parsed.document);
}

std::shared_ptr<data::Collection> Load(const std::filesystem::path& path, const LoadOptions& options) {
  const auto doc        = ReadDocument(path);
  auto       collection = FromDocument(doc, options);

  AOEF_LOG_DEBUG("loaded document", {observability::PathField("path", path),
                                     observability::StringField("collection_type", doc.data().collection_type()),
                                     observability::IntField("records", TotalRecords(doc.data()))});
  return collection;
}

std::vector<std::pair<std::string, int>> RecordCounts(const v1::CollectionRecord& record) {
  std::vector<std::pair<std::string, int>> counts;

  const auto* descriptor = record.GetDescriptor();
  const auto* reflection = record.GetReflection();
  for (int i = 0; i < descriptor->field_count(); ++i) {
    const auto* field = descriptor->field(i);
    if (!field->is_repeated() || field->is_map() ||
        field->cpp_type() != google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE) {
      continue;
    }
    const int size = reflection->FieldSize(record, field);
    if (size > 0) counts.emplace_back(field->name(), size);
  }
  return counts;
}

} // namespace aoef::io
