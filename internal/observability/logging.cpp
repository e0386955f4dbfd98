#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace soilhex::observability {
namespace {

constexpr const char* kLoggerName     = "soilhex";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// Environment beats config beats the built-in default.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') return value;
  if (!configured.empty()) return configured;
  return fallback;
}

/*
  stdout carries run summaries, so every record goes to stderr, including
  those emitted before InitializeLogging ran.
*/
std::shared_ptr<spdlog::logger> Logger() {
  static std::mutex mutex;
  std::lock_guard   lock(mutex);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(kDefaultPattern);
    spdlog::set_default_logger(logger);
  }
  return logger;
}

// Values with spaces, quotes or '=' are quoted so a record splits cleanly on spaces.
void AppendValue(fmt::memory_buffer& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \"=") == std::string::npos) {
    fmt::format_to(std::back_inserter(out), "{}", value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  fmt::format_to(std::back_inserter(out), " trace_id={} span_id={}", HexId(trace_bytes, 16), HexId(span_bytes, 8));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.6g}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const soilhex::runtime::config::RuntimeConfig& config) {
  auto logger = Logger();

  const auto level_name = Setting("SOILHEX_LOG_LEVEL", config.logging().level(), "info");
  auto       level      = spdlog::level::from_str(level_name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && level_name != "off") {
    level = spdlog::level::info;
    logger->warn("Unknown log level {}, using info", level_name);
  }

  logger->set_level(level);
  logger->set_pattern(Setting("SOILHEX_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->flush_on(spdlog::level::warn);
  g_include_trace_context = config.logging().include_trace_context();
}

void ShutdownLogging() {
  Logger()->flush();
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = Logger();
  if (!logger->should_log(level)) return;

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(line), " {}=", field.key);
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  logger->log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace soilhex::observability
