#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace framecomp::runtime::config {
class RuntimeConfig;
}

namespace framecomp::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process-wide "frame-compositor" logger.

  FRAMECOMP_LOG_LEVEL / FRAMECOMP_LOG_PATTERN / FRAMECOMP_LOG_INCLUDE_TRACE_CONTEXT
  override the config file. Safe to call more than once.
*/
void InitializeLogging(const framecomp::runtime::config::RuntimeConfig& config);
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

} // namespace framecomp::observability

#define FRAMECOMP_LOG_DEBUG(message, ...) ::framecomp::observability::LogDebug((message), ##__VA_ARGS__)
#define FRAMECOMP_LOG_INFO(message, ...) ::framecomp::observability::LogInfo((message), ##__VA_ARGS__)
#define FRAMECOMP_LOG_WARN(message, ...) ::framecomp::observability::LogWarn((message), ##__VA_ARGS__)
#define FRAMECOMP_LOG_ERROR(message, ...) ::framecomp::observability::LogError((message), ##__VA_ARGS__)
