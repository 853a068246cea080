#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace install::observability {
namespace {

constexpr char kLoggerName[]     = "install-manager";
constexpr char kDefaultLevel[]   = "info";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

// env var wins over config, config wins over the built-in default
std::string Pick(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') return value;
  return configured.empty() ? fallback : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t=\"") != std::string_view::npos;
}

void AppendValue(std::string* out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out->append(value);
    return;
  }
  out->push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out->push_back('\\');
    out->push_back(c);
  }
  out->push_back('"');
}

} // namespace

// ------------------------------------------------------------
// Fields
// ------------------------------------------------------------

LogField StringField(std::string_view key, std::string_view value) {
  return LogField{std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return LogField{std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return LogField{std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return LogField{std::string(key), value ? "true" : "false"};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(&out, field.value);
  }
  return out;
}

// ------------------------------------------------------------
// Setup
// ------------------------------------------------------------

void InitializeLogging(const install::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!logging.file_path().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file_path()));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(Pick("INSTALL_LOG_PATTERN", logging.pattern(), kDefaultPattern));

  const auto level_name = Pick("INSTALL_LOG_LEVEL", logging.level(), kDefaultLevel);
  auto       level      = spdlog::level::from_str(level_name);
  // from_str maps anything unknown to off
  const bool unknown_level = level == spdlog::level::off && level_name != "off";
  if (unknown_level) level = spdlog::level::info;
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);

  if (unknown_level) LogWarn("Unknown log level, using info", {StringField("level", level_name)});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace install::observability
