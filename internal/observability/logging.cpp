#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace clusterlink::observability {
namespace {

constexpr const char* kLoggerName     = "clusterlink";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
constexpr const char* kDefaultSink    = "stdout";

struct Setting {
  std::string value;
  std::string source;
};

// Environment first, then the config file, then the built-in default.
Setting Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') {
    return {value, env_name};
  }
  if (!configured.empty()) {
    return {configured, "config"};
  }
  return {fallback, "default"};
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  return std::any_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) || c == '"' || c == '='; });
}

void AppendQuoted(std::string& out, const std::string& value) {
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& sink) {
  if (sink == "stderr") return spdlog::stderr_color_mt(kLoggerName);
  return spdlog::stdout_color_mt(kLoggerName);
}

} // namespace

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "off") return spdlog::level::off;
  if (lowered == "warning") return spdlog::level::warn;
  if (lowered == "error") return spdlog::level::err;

  // from_str maps anything it does not know to off
  const auto level = spdlog::level::from_str(lowered);
  if (level == spdlog::level::off) return std::nullopt;
  return level;
}

bool IsKnownSink(std::string_view name) {
  return name == "stdout" || name == "stderr";
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out += field.key;
    out.push_back('=');
    if (NeedsQuoting(field.value)) {
      AppendQuoted(out, field.value);
    } else {
      out += field.value;
    }
  }
  return out;
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const clusterlink::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // Problems are collected and reported once the logger exists.
  std::vector<std::string> rejected;

  auto sink = Resolve("CLUSTERLINK_LOG_SINK", logging.sink(), kDefaultSink);
  if (!IsKnownSink(sink.value)) {
    rejected.push_back("sink '" + sink.value + "' from " + sink.source);
    sink = {kDefaultSink, "default"};
  }

  auto level  = Resolve("CLUSTERLINK_LOG_LEVEL", logging.level(), kDefaultLevel);
  auto parsed = ParseLevel(level.value);
  if (!parsed) {
    rejected.push_back("level '" + level.value + "' from " + level.source);
    level  = ParseLevel(logging.level()) ? Setting{logging.level(), "config"} : Setting{kDefaultLevel, "default"};
    parsed = ParseLevel(level.value);
  }

  const auto pattern = Resolve("CLUSTERLINK_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  spdlog::drop(kLoggerName);
  auto logger = MakeLogger(sink.value);
  logger->set_pattern(pattern.value);
  logger->set_level(*parsed);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  for (const auto& what : rejected) {
    LogWarn("Ignoring unusable logging setting", {StringField("setting", what)});
  }
  LogDebug("Logging initialized",
           {StringField("level", level.value),
            StringField("level_source", level.source),
            StringField("sink", sink.value)});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace clusterlink::observability
