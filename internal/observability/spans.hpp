#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace signoff::runtime::config {
class RuntimeConfig;
}

namespace signoff::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"signoff-reporter"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

/*
  Exporter settings for one OTLP signal, "traces" or "metrics".

  The endpoint is taken from the observability section of the config,
  then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the local collector default for the transport.
*/
OtlpConfig ResolveOtlpConfig(const signoff::runtime::config::RuntimeConfig& config, std::string_view signal);

bool InitializeTracing(const signoff::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const signoff::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

inline constexpr std::string_view kRunIdAttribute    = "report.run_id";
inline constexpr std::string_view kAsOfAttribute     = "report.as_of";
inline constexpr std::string_view kPipelineAttribute = "report.pipeline";
inline constexpr std::string_view kRouteAttribute    = "rpc.method";

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// "report.run", tagged with the run id and the pinned as-of.
SpanScope StartRunSpan(std::string_view run_id, std::string_view as_of);

// "report.pipeline.<name>", tagged with the run id of the calling thread's
// ScopedRunContext.
SpanScope StartPipelineSpan(std::string_view pipeline);

// "rpc.<route>"; run_id is the run a query is pinned to, empty otherwise.
SpanScope StartRpcSpan(std::string_view route, std::string_view run_id);

/*
  Process-wide instruments.

  Per-run drop counts are always part of RunSummary; the counters here only
  mirror them to the metrics backend when one is configured.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordRun(bool success);
  void ObserveRunDurationMs(double duration_ms);
  void RecordPipelineRows(std::string_view pipeline, std::uint64_t rows);
  void RecordDropped(std::string_view pipeline, std::string_view reason, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const signoff::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const signoff::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordRun(bool) {
}

inline void Metrics::ObserveRunDurationMs(double) {
}

inline void Metrics::RecordPipelineRows(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordDropped(std::string_view, std::string_view, std::uint64_t) {
}
#endif

} // namespace signoff::observability
