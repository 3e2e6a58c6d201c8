#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace typelog::runtime::config {
class RuntimeConfig;
}

namespace typelog::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const typelog::runtime::config::RuntimeConfig& config);
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

} // namespace typelog::observability

#define TYPELOG_LOG_DEBUG(message, ...) ::typelog::observability::LogDebug((message), ##__VA_ARGS__)
#define TYPELOG_LOG_INFO(message, ...) ::typelog::observability::LogInfo((message), ##__VA_ARGS__)
#define TYPELOG_LOG_WARN(message, ...) ::typelog::observability::LogWarn((message), ##__VA_ARGS__)
#define TYPELOG_LOG_ERROR(message, ...) ::typelog::observability::LogError((message), ##__VA_ARGS__)
