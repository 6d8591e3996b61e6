#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/util/run_id.hpp"

namespace {

using signoff::observability::CurrentPipeline;
using signoff::observability::CurrentRunId;
using signoff::observability::FormatLogLine;
using signoff::observability::IntField;
using signoff::observability::ScopedRunContext;
using signoff::observability::StringField;

void TestLogLineCarriesRunContext() {
  assert(FormatLogLine("Report run started", {}) == "Report run started");
  {
    ScopedRunContext run("r-1");
    assert(CurrentRunId() == "r-1");
    assert(FormatLogLine("Report run started", {StringField("as_of", "2024-06-15T00:00:00Z")}) ==
           "Report run started run_id=r-1 as_of=2024-06-15T00:00:00Z");
    {
      ScopedRunContext pipeline("r-1", "risk");
      assert(FormatLogLine("Pipeline dropped rows", {StringField("reason", "missing_theater"), IntField("count", 2)}) ==
             "Pipeline dropped rows run_id=r-1 pipeline=risk reason=missing_theater count=2");
    }
    assert(CurrentPipeline().empty());
    assert(CurrentRunId() == "r-1");
  }
  assert(CurrentRunId().empty());
}

void TestRunContextIsPerThread() {
  ScopedRunContext run("r-2");
  std::string      seen = "unset";
  std::thread([&] { seen = CurrentRunId(); }).join();
  assert(seen.empty());
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatLogLine("Report run failed", {StringField("error", "database \"main\" unavailable")}) ==
         "Report run failed error=\"database \\\"main\\\" unavailable\"");
}

void TestOtlpEndpointResolution() {
  using signoff::observability::OtlpTransport;
  using signoff::observability::ResolveOtlpConfig;

  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");

  signoff::runtime::config::RuntimeConfig config;
  auto                                    grpc = ResolveOtlpConfig(config, "traces");
  assert(grpc.transport == OtlpTransport::kGrpc);
  assert(grpc.endpoint == "localhost:4317");
  assert(grpc.service_name == "signoff-reporter");

  config.mutable_observability()->set_transport(signoff::runtime::config::OTLP_TRANSPORT_HTTP);
  config.mutable_observability()->set_service_name("compliance-nightly");
  auto http = ResolveOtlpConfig(config, "metrics");
  assert(http.transport == OtlpTransport::kHttpProtobuf);
  assert(http.endpoint == "http://localhost:4318/v1/metrics");
  assert(http.service_name == "compliance-nightly");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://collector:4318/v1/traces", 1);
  assert(ResolveOtlpConfig(config, "traces").endpoint == "http://collector:4318/v1/traces");
  assert(ResolveOtlpConfig(config, "metrics").endpoint == "http://collector:4318");

  config.mutable_observability()->set_otlp_endpoint("http://configured:4318");
  assert(ResolveOtlpConfig(config, "traces").endpoint == "http://configured:4318");

  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
}

void TestReportSpansWithoutExporter() {
  ScopedRunContext run("r-3");
  auto             run_span = signoff::observability::StartRunSpan("r-3", "2024-06-15T00:00:00Z");
  auto             pipeline = signoff::observability::StartPipelineSpan("history");
  pipeline.SetAttribute("pipeline.rows", static_cast<std::int64_t>(4));
  run_span.AddEvent("export_failed");
}

void TestRunIdsAreVersion4Uuids() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto id = signoff::util::NewRunId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    assert(id.find_first_not_of("0123456789abcdef-") == std::string::npos);
    seen.insert(id);
  }
  assert(seen.size() == 64);
}

} // namespace

int main() {
  TestLogLineCarriesRunContext();
  TestRunContextIsPerThread();
  TestValuesWithSpacesAreQuoted();
  TestOtlpEndpointResolution();
  TestReportSpansWithoutExporter();
  TestRunIdsAreVersion4Uuids();

  std::cout << "signoff_reporter_unit_observability: pass\n";
  return 0;
}
