#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace install::runtime::config {
class RuntimeConfig;
}

namespace install::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by spaces; values with blanks, '=' or quotes are quoted
std::string FormatFields(std::initializer_list<LogField> fields);

/*
  Installs the "install-manager" logger as spdlog's default.
  INSTALL_LOG_LEVEL / INSTALL_LOG_PATTERN override the config values.
*/
void InitializeLogging(const install::runtime::config::RuntimeConfig& config);
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

} // namespace install::observability

#define INSTALL_LOG_DEBUG(message, ...) ::install::observability::LogDebug((message), ##__VA_ARGS__)
#define INSTALL_LOG_INFO(message, ...) ::install::observability::LogInfo((message), ##__VA_ARGS__)
#define INSTALL_LOG_WARN(message, ...) ::install::observability::LogWarn((message), ##__VA_ARGS__)
#define INSTALL_LOG_ERROR(message, ...) ::install::observability::LogError((message), ##__VA_ARGS__)
