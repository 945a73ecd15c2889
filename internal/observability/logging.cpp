#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace seat::observability {
namespace {

constexpr const char* kLoggerName = "seat-inventory";

// Environment first, then config, then default.
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& file) {
  if (file.empty()) {
    return spdlog::stderr_color_mt(kLoggerName);
  }
  // throws spdlog::spdlog_ex when the file cannot be opened
  return spdlog::basic_logger_mt(kLoggerName, file);
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    out += field.value;
  }
  return out;
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

LogField TimeField(std::string_view key, util::TimePoint value) {
  return {std::string(key), util::FormatRfc3339(value)};
}

void InitializeLogging(const seat::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // re-initialization replaces the previous logger (tests build several apps)
  spdlog::drop(kLoggerName);

  auto logger = MakeLogger(Resolve("SEAT_LOG_FILE", logging.file(), ""));
  logger->set_pattern(Resolve("SEAT_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"));
  logger->set_level(spdlog::level::from_str(Resolve("SEAT_LOG_LEVEL", logging.level(), "warn")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  const auto serialized_fields = SerializeFields(fields);
  if (serialized_fields.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, serialized_fields);
}

} // namespace seat::observability
