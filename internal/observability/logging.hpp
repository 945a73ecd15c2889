#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace seat::runtime::config {
class RuntimeConfig;
}

namespace seat::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// RFC 3339, UTC.
LogField TimeField(std::string_view key, util::TimePoint value);

/*
  Installs the "seat-inventory" logger as spdlog's default.

  Output goes to logging.file when configured (appended), otherwise to stderr;
  stdout is reserved for command output either way.
*/
void InitializeLogging(const seat::runtime::config::RuntimeConfig& config);
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

} // namespace seat::observability

#define SEAT_LOG_DEBUG(message, ...) ::seat::observability::LogDebug((message), ##__VA_ARGS__)
#define SEAT_LOG_INFO(message, ...) ::seat::observability::LogInfo((message), ##__VA_ARGS__)
#define SEAT_LOG_WARN(message, ...) ::seat::observability::LogWarn((message), ##__VA_ARGS__)
#define SEAT_LOG_ERROR(message, ...) ::seat::observability::LogError((message), ##__VA_ARGS__)
