#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace edgesync::runtime::config {
class RuntimeConfig;
}

namespace edgesync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// Tags an error/warn line as an operational alert, e.g. alert=storage_full.
inline LogField AlertField(std::string_view kind) {
  return StringField("alert", kind);
}

void InitializeLogging(const edgesync::runtime::config::RuntimeConfig& config);
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

} // namespace edgesync::observability

#define EDGESYNC_LOG_DEBUG(message, ...) ::edgesync::observability::LogDebug((message), ##__VA_ARGS__)
#define EDGESYNC_LOG_INFO(message, ...) ::edgesync::observability::LogInfo((message), ##__VA_ARGS__)
#define EDGESYNC_LOG_WARN(message, ...) ::edgesync::observability::LogWarn((message), ##__VA_ARGS__)
#define EDGESYNC_LOG_ERROR(message, ...) ::edgesync::observability::LogError((message), ##__VA_ARGS__)
