#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace runtrack::runtime::config {
class RuntimeConfig;
}

namespace runtrack::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const runtrack::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Active verbosity as the numeric level understood by operation
  runtimes (10 debug, 20 info, 30 warning, 40 error, 50 critical).
*/
std::string CurrentLevelText();

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

} // namespace runtrack::observability

#define RUNTRACK_LOG_DEBUG(message, ...) ::runtrack::observability::LogDebug((message), ##__VA_ARGS__)
#define RUNTRACK_LOG_INFO(message, ...) ::runtrack::observability::LogInfo((message), ##__VA_ARGS__)
#define RUNTRACK_LOG_WARN(message, ...) ::runtrack::observability::LogWarn((message), ##__VA_ARGS__)
#define RUNTRACK_LOG_ERROR(message, ...) ::runtrack::observability::LogError((message), ##__VA_ARGS__)
