#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace x402::runtime::config {
class LoggingConfig;
}

namespace x402::observability {

// key=value pair appended to a log line; values with spaces, quotes or '=' are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// REGISTRY_LOG_LEVEL / REGISTRY_LOG_PATTERN override the config.
// Throws std::runtime_error on an unknown level name or an unwritable log file.
void InitializeLogging(const x402::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace x402::observability

#define REGISTRY_LOG_DEBUG(message, ...) ::x402::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define REGISTRY_LOG_INFO(message, ...) ::x402::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define REGISTRY_LOG_WARN(message, ...) ::x402::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define REGISTRY_LOG_ERROR(message, ...) ::x402::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
