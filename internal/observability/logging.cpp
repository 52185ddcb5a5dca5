#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/nostd/span.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace sealer::observability {
namespace {

constexpr const char* kLoggerName     = "export-sealer";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  bool                      trace_context = false;
  std::string               rejected_level;
};

// Environment wins over the config file, which wins over the built-in default.
std::string Pick(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* env = std::getenv(env_name); env && *env) {
    return env;
  }
  return configured.empty() ? fallback : configured;
}

LogSettings ResolveSettings(const sealer::runtime::config::LoggingConfig& logging) {
  LogSettings settings;

  const auto level_name = Pick("SEALER_LOG_LEVEL", logging.level(), "info");
  settings.level        = spdlog::level::from_str(level_name);
  // from_str maps unknown names to "off"; silence must be asked for by name.
  if (settings.level == spdlog::level::off && level_name != "off") {
    settings.level          = spdlog::level::info;
    settings.rejected_level = level_name;
  }

  settings.pattern = Pick("SEALER_LOG_PATTERN", logging.pattern(), kDefaultPattern);

  settings.trace_context = logging.include_trace_context();
  if (const char* env = std::getenv("SEALER_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(env);
    settings.trace_context = flag == "1" || flag == "true";
  }
  return settings;
}

std::atomic<bool> g_trace_context{false};

void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line.append(field.key);
  line.push_back('=');
  if (!field.value.empty() && field.value.find_first_of(" \t\"=") == std::string::npos) {
    line.append(field.value);
    return;
  }
  std::ostringstream quoted;
  quoted << std::quoted(field.value);
  line.append(quoted.str());
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_trace_context.load(std::memory_order_relaxed)) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(opentelemetry::nostd::span<char, 32>{trace_hex, 32});
  context.span_id().ToLowerBase16(opentelemetry::nostd::span<char, 16>{span_hex, 16});
  AppendField(line, {"trace_id", std::string(trace_hex, sizeof(trace_hex))});
  AppendField(line, {"span_id", std::string(span_hex, sizeof(span_hex))});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  return line;
}

void InitializeLogging(const sealer::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config.logging());

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_trace_context.store(settings.trace_context, std::memory_order_relaxed);

  if (!settings.rejected_level.empty()) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", settings.rejected_level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  auto line = FormatLine(message, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace sealer::observability
