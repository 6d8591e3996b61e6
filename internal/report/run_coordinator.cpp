#include "run_coordinator.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "internal/compliance/report_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/export/report_exporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/report/report_set.hpp"
#include "internal/report/report_store.hpp"
#include "internal/snapshot/snapshot.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/run_id.hpp"

namespace signoff::reports {

using namespace signoff::report::v1;
using signoff::observability::IntField;
using signoff::observability::ScopedRunContext;
using signoff::observability::StringField;

namespace {

template <typename Row>
void AddPipelineSummary(RunSummary& summary, std::string_view name, const compliance::PipelineResult<Row>& result) {
  auto* pipeline = summary.add_pipelines();
  pipeline->set_pipeline(std::string(name));
  pipeline->set_rows(result.rows.size());
  pipeline->set_eligible_contracts(result.eligible_contracts);
  for (const auto& [reason, count] : result.drops.All()) {
    (*pipeline->mutable_dropped())[reason] = count;
  }

  ScopedRunContext context(summary.run_id(), std::string(name));
  auto&            metrics = signoff::observability::Metrics::Instance();
  metrics.RecordPipelineRows(name, result.rows.size());
  for (const auto& [reason, count] : result.drops.All()) {
    metrics.RecordDropped(name, reason, count);
    SIGNOFF_LOG_INFO("Pipeline dropped rows", {StringField("reason", reason), IntField("count", static_cast<std::int64_t>(count))});
  }
}

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

RunCoordinator::RunCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReportStore> store,
                               compliance::ComplianceSettings settings, std::shared_ptr<exporter::ReportExporter> exporter)
    : repository_(std::move(repository)), store_(std::move(store)), settings_(std::move(settings)), exporter_(std::move(exporter)) {
}

RunSummary RunCoordinator::Run(std::optional<util::TimePoint> as_of) {
  std::lock_guard lock(run_mutex_);

  const auto timer      = std::chrono::steady_clock::now();
  const auto started_at = util::Now();
  const auto pinned     = as_of.value_or(started_at);

  RunSummary summary;
  summary.set_run_id(util::NewRunId());
  *summary.mutable_as_of()      = util::ToProto(pinned);
  *summary.mutable_started_at() = util::ToProto(started_at);
  summary.set_status(RUN_STATUS_RUNNING);
  store_->Publish(RunEntry{summary, nullptr});

  ScopedRunContext context(summary.run_id());
  auto             span = signoff::observability::StartRunSpan(summary.run_id(), util::FormatTimestamp(pinned));
  SIGNOFF_LOG_INFO("Report run started", {StringField("as_of", util::FormatTimestamp(pinned))});

  std::shared_ptr<const ReportSet> reports;
  try {
    auto tx     = repository_->Begin();
    auto tables = repository_->LoadTables(*tx);
    tx->Commit();

    auto snapshot = std::make_shared<const snapshot::Snapshot>(std::move(tables));
    span.SetAttribute("run.contracts", static_cast<std::int64_t>(snapshot->Contracts().size()));
    span.SetAttribute("run.signoffs", static_cast<std::int64_t>(snapshot->SignoffCount()));

    auto set    = std::make_shared<ReportSet>();
    set->run_id = summary.run_id();
    set->as_of  = pinned;
    set->tables = compliance::ComputeReports(std::move(snapshot), settings_, pinned);

    AddPipelineSummary(summary, compliance::kHistoryPipeline, set->tables.history);
    AddPipelineSummary(summary, compliance::kQualificationPipeline, set->tables.qualification);
    AddPipelineSummary(summary, compliance::kNeverSignedOffPipeline, set->tables.never_signed_off);
    AddPipelineSummary(summary, compliance::kRiskPipeline, set->tables.risk);
    summary.set_ambiguous_hierarchy_matches(set->tables.ambiguous_hierarchy_matches);
    if (set->tables.ambiguous_hierarchy_matches > 0) {
      SIGNOFF_LOG_WARN("Ambiguous org hierarchy matches", {IntField("users", static_cast<std::int64_t>(set->tables.ambiguous_hierarchy_matches))});
    }
    reports = std::move(set);
  } catch (const std::exception& ex) {
    summary.set_status(RUN_STATUS_FAILED);
    summary.set_error_message(ex.what());
    *summary.mutable_completed_at() = util::ToProto(util::Now());
    store_->Publish(RunEntry{summary, nullptr});

    span.RecordException(ex.what());
    signoff::observability::Metrics::Instance().RecordRun(false);
    signoff::observability::Metrics::Instance().ObserveRunDurationMs(ElapsedMs(timer));
    SIGNOFF_LOG_ERROR("Report run failed", {StringField("error", ex.what())});
    throw util::RunFailed(summary.run_id(), ex.what());
  }

  summary.set_status(RUN_STATUS_COMPLETED);
  *summary.mutable_completed_at() = util::ToProto(util::Now());
  store_->Publish(RunEntry{summary, reports});

  const auto duration_ms = ElapsedMs(timer);
  signoff::observability::Metrics::Instance().RecordRun(true);
  signoff::observability::Metrics::Instance().ObserveRunDurationMs(duration_ms);
  SIGNOFF_LOG_INFO("Report run completed",
                   {IntField("history_rows", static_cast<std::int64_t>(reports->tables.history.rows.size())),
                    IntField("qualification_rows", static_cast<std::int64_t>(reports->tables.qualification.rows.size())),
                    IntField("never_signed_off_rows", static_cast<std::int64_t>(reports->tables.never_signed_off.rows.size())),
                    IntField("risk_rows", static_cast<std::int64_t>(reports->tables.risk.rows.size())),
                    signoff::observability::DoubleField("duration_ms", duration_ms)});

  if (exporter_) {
    try {
      exporter_->Export(*reports);
    } catch (const std::exception& ex) {
      span.AddEvent("export_failed");
      SIGNOFF_LOG_ERROR("Report export failed", {StringField("error", ex.what())});
    }
  }

  return summary;
}

} // namespace signoff::reports
