#include "report_engine.hpp"

#include <future>
#include <string>
#include <utility>

#include "internal/compliance/org_attribution.hpp"
#include "internal/compliance/pipelines.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/snapshot/snapshot.hpp"

namespace signoff::compliance {

namespace {

template <typename Fn>
auto LaunchPipeline(std::string_view name, Fn&& fn) {
  // the log context is per thread; carry the run id onto the worker
  return std::async(std::launch::async, [name, run_id = signoff::observability::CurrentRunId(), fn = std::forward<Fn>(fn)]() {
    signoff::observability::ScopedRunContext context(run_id, std::string(name));
    auto span   = signoff::observability::StartPipelineSpan(name);
    auto result = fn();
    span.SetAttribute("pipeline.rows", static_cast<std::int64_t>(result.rows.size()));
    span.SetAttribute("pipeline.eligible_contracts", static_cast<std::int64_t>(result.eligible_contracts));
    SIGNOFF_LOG_DEBUG("Pipeline finished", {signoff::observability::IntField("rows", static_cast<std::int64_t>(result.rows.size())),
                                            signoff::observability::IntField("eligible_contracts", static_cast<std::int64_t>(result.eligible_contracts))});
    return result;
  });
}

} // namespace

ReportTables ComputeReports(std::shared_ptr<const snapshot::Snapshot> snapshot, const ComplianceSettings& settings, util::TimePoint as_of) {
  const OrgAttributionResolver attribution(*snapshot, settings.org_domain);
  const PipelineContext        ctx{*snapshot, settings, attribution, as_of};

  auto history          = LaunchPipeline(kHistoryPipeline, [&ctx] { return RunHistoryPipeline(ctx); });
  auto qualification    = LaunchPipeline(kQualificationPipeline, [&ctx] { return RunQualificationPipeline(ctx); });
  auto never_signed_off = LaunchPipeline(kNeverSignedOffPipeline, [&ctx] { return RunNeverSignedOffPipeline(ctx); });
  auto risk             = LaunchPipeline(kRiskPipeline, [&ctx] { return RunRiskPipeline(ctx); });

  // Wait for every pipeline before get() can throw; ctx must outlive them.
  history.wait();
  qualification.wait();
  never_signed_off.wait();
  risk.wait();

  ReportTables tables;
  tables.history                     = history.get();
  tables.qualification               = qualification.get();
  tables.never_signed_off            = never_signed_off.get();
  tables.risk                        = risk.get();
  tables.ambiguous_hierarchy_matches = attribution.AmbiguousMatches();
  return tables;
}

} // namespace signoff::compliance
