#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace omni::runtime::config {
class RuntimeConfig;
}

namespace omni::observability {

/*
  Structured key=value logging on top of spdlog.

  Before InitializeLogging() runs, messages go to spdlog's default logger,
  so library code and tests can log without any setup.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Safe to call more than once; the last call wins.
void InitializeLogging(const omni::runtime::config::RuntimeConfig& config);
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

} // namespace omni::observability

#define OMNI_LOG_DEBUG(message, ...) ::omni::observability::LogDebug((message), ##__VA_ARGS__)
#define OMNI_LOG_INFO(message, ...) ::omni::observability::LogInfo((message), ##__VA_ARGS__)
#define OMNI_LOG_WARN(message, ...) ::omni::observability::LogWarn((message), ##__VA_ARGS__)
#define OMNI_LOG_ERROR(message, ...) ::omni::observability::LogError((message), ##__VA_ARGS__)
