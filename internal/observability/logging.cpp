#include "internal/observability/logging.hpp"

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace retest::observability {
namespace {

constexpr const char* kDefaultLevel   = "warn";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e [%n] [%^%l%$] %v";

std::string Setting(const char* env_var, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_var); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string_view::npos;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const retest::runtime::config::RuntimeConfig& config, std::string_view process) {
  const std::string name(process.empty() ? "retest" : process);

  auto logger = spdlog::get(name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(name);
  }
  logger->set_pattern(Setting("RETEST_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("RETEST_LOG_LEVEL", config.logging().level(), kDefaultLevel)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace retest::observability
