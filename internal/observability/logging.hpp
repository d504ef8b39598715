#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace retest::runtime::config {
class RuntimeConfig;
}

namespace retest::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Routes engine logs to stderr; stdout is left to the host runner.

  process names the emitting process ("coordinator", "worker") and
  becomes the logger name, so lines from parallel workers sharing a
  terminal stay attributable. RETEST_LOG_LEVEL and RETEST_LOG_PATTERN
  override the config. Before this is called, spdlog's default
  logger is used.
*/
void InitializeLogging(const retest::runtime::config::RuntimeConfig& config, std::string_view process);
void ShutdownLogging();

// key=value fields; values containing spaces or quotes are quoted
std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace retest::observability

#define RETEST_LOG_DEBUG(message, ...) ::retest::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define RETEST_LOG_INFO(message, ...) ::retest::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define RETEST_LOG_WARN(message, ...) ::retest::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define RETEST_LOG_ERROR(message, ...) ::retest::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
