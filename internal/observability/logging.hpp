#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace assetxfer::runtime::config {
class RuntimeConfig;
}

namespace assetxfer::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Routes the default spdlog logger to stderr; stdout carries command output.
  Level and pattern: ASSETXFER_LOG_LEVEL / ASSETXFER_LOG_PATTERN, then config,
  then defaults.
*/
void InitializeLogging(const assetxfer::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// key=value pairs after the message; values with spaces are quoted.
std::string SerializeFields(std::initializer_list<LogField> fields);

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

} // namespace assetxfer::observability

#define ASSETXFER_LOG_DEBUG(message, ...) ::assetxfer::observability::LogDebug((message), ##__VA_ARGS__)
#define ASSETXFER_LOG_INFO(message, ...) ::assetxfer::observability::LogInfo((message), ##__VA_ARGS__)
#define ASSETXFER_LOG_WARN(message, ...) ::assetxfer::observability::LogWarn((message), ##__VA_ARGS__)
#define ASSETXFER_LOG_ERROR(message, ...) ::assetxfer::observability::LogError((message), ##__VA_ARGS__)
