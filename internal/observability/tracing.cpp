#include "internal/observability/spans.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>
#endif

namespace signoff::observability {

namespace {

std::string SignalEnvName(std::string_view signal) {
  std::string name = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return name + "_ENDPOINT";
}

} // namespace

OtlpConfig ResolveOtlpConfig(const signoff::runtime::config::RuntimeConfig& config, std::string_view signal) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.transport =
      observability.transport() == signoff::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }

  if (!observability.otlp_endpoint().empty()) {
    otlp.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEnvName(signal).c_str())) {
    otlp.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    otlp.endpoint = endpoint;
  } else if (otlp.transport == OtlpTransport::kHttpProtobuf) {
    otlp.endpoint = "http://localhost:4318/v1/" + std::string(signal);
  } else {
    otlp.endpoint = "localhost:4317";
  }
  return otlp;
}

SpanScope StartRunSpan(std::string_view run_id, std::string_view as_of) {
  SpanScope span("report.run");
  span.SetAttribute(kRunIdAttribute, run_id);
  span.SetAttribute(kAsOfAttribute, as_of);
  return span;
}

SpanScope StartPipelineSpan(std::string_view pipeline) {
  SpanScope span("report.pipeline." + std::string(pipeline));
  span.SetAttribute(kPipelineAttribute, pipeline);
  if (!CurrentRunId().empty()) {
    span.SetAttribute(kRunIdAttribute, CurrentRunId());
  }
  return span;
}

SpanScope StartRpcSpan(std::string_view route, std::string_view run_id) {
  SpanScope span("rpc." + std::string(route));
  span.SetAttribute(kRouteAttribute, route);
  if (!run_id.empty()) {
    span.SetAttribute(kRunIdAttribute, run_id);
  }
  return span;
}

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

constexpr const char* kTracerName    = "signoff-reporter";
constexpr const char* kTracerVersion = "0.1.0";

std::unique_ptr<sdktrace::SpanExporter> CreateExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = config.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = config.endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const signoff::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, "traces");
  auto       processor   = sdktrace::BatchSpanProcessorFactory::Create(CreateExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  auto       provider    = sdktrace::TracerProviderFactory::Create(
      std::move(processor), resource::Resource::Create(resource::ResourceAttributes{{"service.name", otlp_config.service_name}}));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

// Without InitializeTracing spans go to the global (no-op) provider.
SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = g_tracer ? g_tracer : trace_api::Provider::GetTracerProvider()->GetTracer(kTracerName, kTracerVersion);
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

#endif

} // namespace signoff::observability
