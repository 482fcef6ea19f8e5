#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace aoef::runtime::config {
class RuntimeConfig;
}

namespace aoef::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Quoted, so paths with spaces stay one field.
LogField PathField(std::string_view key, const std::filesystem::path& value);

void InitializeLogging(const aoef::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace aoef::observability

#define AOEF_LOG_DEBUG(message, ...) ::aoef::observability::LogDebug((message), ##__VA_ARGS__)
#define AOEF_LOG_INFO(message, ...) ::aoef::observability::LogInfo((message), ##__VA_ARGS__)
#define AOEF_LOG_WARN(message, ...) ::aoef::observability::LogWarn((message), ##__VA_ARGS__)
#define AOEF_LOG_ERROR(message, ...) ::aoef::observability::LogError((message), ##__VA_ARGS__)
