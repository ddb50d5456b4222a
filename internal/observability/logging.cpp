#include "internal/observability/logging.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"

#ifdef ENGRAM_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace engram::observability {
namespace {

constexpr char kLoggerName[]     = "engramd";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  if (!configured.empty()) {
    return configured;
  }
  return fallback;
}

bool ResolveTraceContextEnabled(const engram::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("ENGRAM_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

std::atomic<bool> g_include_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') return true;
  }
  return false;
}

// key=value pairs; values with spaces or separators are quoted
void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    if (!NeedsQuoting(field.value)) {
      line.append(field.value);
      continue;
    }
    line.push_back('"');
    for (char c : field.value) {
      if (c == '"' || c == '\\') line.push_back('\\');
      if (c == '\n') {
        line.append("\\n");
        continue;
      }
      line.push_back(c);
    }
    line.push_back('"');
  }
}

#ifdef ENGRAM_ENABLE_OTEL
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

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context.load()) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line.append(" trace_id=").append(HexId(trace_bytes, 16));
  line.append(" span_id=").append(HexId(span_bytes, 8));
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

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.4f}", value)};
}

void InitializeLogging(const engram::runtime::config::RuntimeConfig& config) {
  // re-initialization replaces the previous logger
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(FromEnvOr("ENGRAM_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(FromEnvOr("ENGRAM_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) {
    return;
  }

  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace engram::observability
