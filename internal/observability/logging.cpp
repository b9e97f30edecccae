#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace edgesync::observability {
namespace {

constexpr std::uint64_t kDefaultMaxFileBytes = 10ull * 1024 * 1024;
constexpr std::uint32_t kDefaultMaxFiles     = 3;

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

// node id goes into every line so logs from a fleet can be merged
std::string LoggerName(const edgesync::runtime::config::RuntimeConfig& config) {
  return config.node().node_id().empty() ? "edge-sync" : config.node().node_id();
}

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" =\"") != std::string::npos;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) out << ' ';
    first = false;

    out << field.key << '=';
    if (!NeedsQuoting(field.value)) {
      out << field.value;
      continue;
    }
    out << '"';
    for (char c : field.value) {
      if (c == '"' || c == '\\') out << '\\';
      out << c;
    }
    out << '"';
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const edgesync::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file_path = EnvOr("EDGESYNC_LOG_FILE", logging.file_path(), "");
  if (!file_path.empty()) {
    const auto max_bytes = logging.max_file_bytes() > 0 ? logging.max_file_bytes() : kDefaultMaxFileBytes;
    const auto max_files = logging.max_files() > 0 ? logging.max_files() : kDefaultMaxFiles;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, static_cast<std::size_t>(max_bytes), max_files));
  }

  const auto name = LoggerName(config);
  spdlog::drop(name);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("EDGESYNC_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v"));
  logger->set_level(spdlog::level::from_str(EnvOr("EDGESYNC_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));

  // a warn or error line must reach disk before a possible power cut
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace edgesync::observability
