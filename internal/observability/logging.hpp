#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace gigbook::runtime::config {
class RuntimeConfig;
}

namespace gigbook::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process logger.

  Level/pattern precedence: GIGBOOK_LOG_LEVEL / GIGBOOK_LOG_PATTERN
  environment, then config, then built-in defaults. Safe to call more
  than once; later calls replace the logger.
*/
void InitializeLogging(const gigbook::runtime::config::RuntimeConfig& config);
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

} // namespace gigbook::observability

#define GIGBOOK_LOG_DEBUG(message, ...) ::gigbook::observability::LogDebug((message), ##__VA_ARGS__)
#define GIGBOOK_LOG_INFO(message, ...) ::gigbook::observability::LogInfo((message), ##__VA_ARGS__)
#define GIGBOOK_LOG_WARN(message, ...) ::gigbook::observability::LogWarn((message), ##__VA_ARGS__)
#define GIGBOOK_LOG_ERROR(message, ...) ::gigbook::observability::LogError((message), ##__VA_ARGS__)
