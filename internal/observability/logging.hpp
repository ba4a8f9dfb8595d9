#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace backupmeta::runtime::config {
class RuntimeConfig;
}

namespace backupmeta::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const backupmeta::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

bool ShouldLog(spdlog::level::level_enum level);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogTrace(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::trace, message, fields);
}

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

} // namespace backupmeta::observability

#define BACKUPMETA_LOG_TRACE(message, ...) ::backupmeta::observability::LogTrace((message), ##__VA_ARGS__)
#define BACKUPMETA_LOG_DEBUG(message, ...) ::backupmeta::observability::LogDebug((message), ##__VA_ARGS__)
#define BACKUPMETA_LOG_INFO(message, ...) ::backupmeta::observability::LogInfo((message), ##__VA_ARGS__)
#define BACKUPMETA_LOG_WARN(message, ...) ::backupmeta::observability::LogWarn((message), ##__VA_ARGS__)
#define BACKUPMETA_LOG_ERROR(message, ...) ::backupmeta::observability::LogError((message), ##__VA_ARGS__)
