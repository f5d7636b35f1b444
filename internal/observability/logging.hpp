#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace clusterlink::runtime::config {
class RuntimeConfig;
}

namespace clusterlink::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Level names as spdlog spells them, case-insensitive. "warning" and
// "error" are accepted too. Empty for anything else.
std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

// Sink names accepted by logging.sink.
bool IsKnownSink(std::string_view name);

// Renders `key=value` pairs separated by spaces. Values that are empty or
// contain whitespace, quotes or '=' are double quoted with escapes.
std::string FormatFields(std::initializer_list<LogField> fields);

/*
  Installs the "clusterlink" logger as spdlog's default. Environment
  variables CLUSTERLINK_LOG_LEVEL, CLUSTERLINK_LOG_PATTERN and
  CLUSTERLINK_LOG_SINK take precedence over the logging section. An
  unusable override is reported and the configured value is used.
*/
void InitializeLogging(const clusterlink::runtime::config::RuntimeConfig& config);
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

} // namespace clusterlink::observability

#define CLUSTERLINK_LOG_DEBUG(message, ...) ::clusterlink::observability::LogDebug((message), ##__VA_ARGS__)
#define CLUSTERLINK_LOG_INFO(message, ...) ::clusterlink::observability::LogInfo((message), ##__VA_ARGS__)
#define CLUSTERLINK_LOG_WARN(message, ...) ::clusterlink::observability::LogWarn((message), ##__VA_ARGS__)
#define CLUSTERLINK_LOG_ERROR(message, ...) ::clusterlink::observability::LogError((message), ##__VA_ARGS__)
