#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sealer::runtime::config {
class RuntimeConfig;
}

namespace sealer::observability {

// Rendered as key=value after the message; values with spaces, quotes or '=' are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// "message key=value ..." as written to the sink, without trace context.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const sealer::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace sealer::observability

#define SEALER_LOG_INFO(message, ...) ::sealer::observability::LogInfo((message), ##__VA_ARGS__)
#define SEALER_LOG_WARN(message, ...) ::sealer::observability::LogWarn((message), ##__VA_ARGS__)
#define SEALER_LOG_ERROR(message, ...) ::sealer::observability::LogError((message), ##__VA_ARGS__)
