#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace signoff::observability {
namespace {

constexpr const char* kLoggerName     = "signoff-reporter";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

thread_local std::string t_run_id;
thread_local std::string t_pipeline;

bool g_include_trace_context{false};

// SIGNOFF_LOG_<name> wins over the logging section of the config file.
std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const signoff::runtime::config::RuntimeConfig& config) {
  if (const char* value = std::getenv("SIGNOFF_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string text(value);
    return text == "1" || text == "true";
  }
  return config.logging().include_trace_context();
}

void AppendField(std::string& line, std::string_view key, std::string_view value) {
  line += ' ';
  line += key;
  line += '=';
  if (value.find_first_of(" \t\"") == std::string_view::npos) {
    line += value;
    return;
  }
  line += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c;
  }
  line += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(line, "trace_id", HexId(trace_bytes, sizeof(trace_bytes)));
  AppendField(line, "span_id", HexId(span_bytes, sizeof(span_bytes)));
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

ScopedRunContext::ScopedRunContext(std::string run_id, std::string pipeline)
    : previous_run_id_(std::exchange(t_run_id, std::move(run_id))), previous_pipeline_(std::exchange(t_pipeline, std::move(pipeline))) {
}

ScopedRunContext::~ScopedRunContext() {
  t_run_id   = std::move(previous_run_id_);
  t_pipeline = std::move(previous_pipeline_);
}

const std::string& CurrentRunId() {
  return t_run_id;
}

const std::string& CurrentPipeline() {
  return t_pipeline;
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  if (!t_run_id.empty()) AppendField(line, "run_id", t_run_id);
  if (!t_pipeline.empty()) AppendField(line, "pipeline", t_pipeline);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  return line;
}

void InitializeLogging(const signoff::runtime::config::RuntimeConfig& config) {
  // re-initialization (tests, config reload) replaces the named logger
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(EnvOr("SIGNOFF_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("SIGNOFF_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextEnabled(config);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  auto line = FormatLogLine(message, fields);
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace signoff::observability
