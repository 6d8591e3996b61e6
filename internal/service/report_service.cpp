#include "report_service.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/compliance/report_rows.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/report/report_set.hpp"
#include "internal/report/report_store.hpp"
#include "internal/report/row_query.hpp"
#include "internal/report/run_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace signoff::service {

using namespace signoff::report::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view run_id, Fn&& fn) {
  auto span = signoff::observability::StartRpcSpan(route, run_id);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    signoff::observability::Metrics::Instance().RecordRequest(route, true);
    signoff::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SIGNOFF_LOG_ERROR("RPC failed", {signoff::observability::StringField("route", route), signoff::observability::StringField("error", ex.what()),
                                     signoff::observability::StringField("run_id", run_id)});
    signoff::observability::Metrics::Instance().RecordRequest(route, false);
    signoff::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void FillContract(const compliance::ContractLabels& labels, ContractProfile* out) {
  out->set_booking_contract(labels.booking_contract);
  out->set_sold_as_service_name(labels.sold_as_service_name);
  out->set_booking_country(labels.booking_country);
  out->set_buying_program_name(labels.buying_program_name);
  out->set_pricing_model_name(labels.pricing_model_name);
  out->set_booked_theater(labels.booked_theater);
  out->set_account_name(labels.account_name);
  out->set_sold_as_sw_allocation(labels.sold_as_sw_allocation);
  out->set_sold_as_hw_allocation(labels.sold_as_hw_allocation);
}

void FillOrg(const compliance::OrgAttribution& org, OrgAttribution* out) {
  out->set_level6_worker_name(org.level6_worker_name);
  out->set_level7_worker_name(org.level7_worker_name);
  out->set_level8_worker_name(org.level8_worker_name);
  out->set_level9_worker_name(org.level9_worker_name);
  out->set_emp_cco_id_masked(org.emp_cco_id_masked);
  out->set_mgr_name(org.mgr_name);
  out->set_theater(org.theater);
}

void Fill(const compliance::HistoryRow& row, HistoryRow* out) {
  FillContract(row.contract, out->mutable_contract());
  out->set_has_signoff(row.has_signoff);
  out->set_is_last_signoff(row.is_last_signoff);
  FillOrg(row.org, out->mutable_org());
  if (!row.has_signoff) return;

  out->set_signoff_id(row.signoff_id);
  out->set_notes(row.notes);
  out->set_sign_off_identity(row.sign_off_identity);
  out->set_signoff_method(row.signoff_method);
  out->set_defer_signoff_reason(row.defer_signoff_reason);
  out->set_engagement_name(row.engagement_name);
  out->set_dc_engagement_id(row.dc_engagement_id);
  out->set_booking_contract(row.contract.booking_contract);
  out->set_user_title(row.user_title);
  out->set_fiscal_qtr_sorted_name(row.fiscal_qtr_sorted_name);
  out->set_fiscal_mth_sorted_name(row.fiscal_mth_sorted_name);
  out->set_cal_week_sorted_short_name(row.cal_week_sorted_short_name);
  out->set_signoff_days_ago(row.signoff_days_ago);
  out->set_dc_user_id(row.dc_user_id);
  if (row.create_dtm) {
    *out->mutable_create_dtm()         = util::ToProto(*row.create_dtm);
    *out->mutable_signoff_create_dtm() = util::ToProto(*row.create_dtm);
  }
}

void Fill(const compliance::QualificationRow& row, QualificationRow* out) {
  out->set_booking_contract(row.booking_contract);
  out->set_ibv_method(row.ibv_method);
  out->set_ibv_identity(row.ibv_identity);
  out->set_ibv_event(row.ibv_event);
  out->set_notes(row.notes);
  out->set_qualified_ibv(row.qualified_ibv);
  out->set_days_since_last_signoff_event(row.days_since_last_signoff_event);
  *out->mutable_last_signoff_date() = util::ToProto(row.last_signoff_date);
}

void Fill(const compliance::NeverSignedOffRow& row, NeverSignedOffRow* out) {
  FillContract(row.contract, out->mutable_contract());
  FillOrg(row.org, out->mutable_org());
}

void Fill(const compliance::RiskRow& row, RiskRow* out) {
  FillContract(row.contract, out->mutable_contract());
  FillOrg(row.org, out->mutable_org());
  out->set_signoff_days_ago(row.signoff_days_ago);
  out->set_signoff_risk(row.signoff_risk);
  *out->mutable_last_signoff_date() = util::ToProto(row.last_signoff_date);
}

// Validates the query before resolving the run so malformed requests are
// reported as such even when no run exists yet.
template <typename Response, typename Select>
Response QueryReport(const ServiceContext& ctx, const RowQuery& req, Select select) {
  const auto filter = signoff::reports::ParseRowFilter(req);
  const auto page   = signoff::reports::ParsePageRequest(req, ctx.default_page_size, ctx.max_page_size);
  const auto set    = ctx.store->Resolve(req.run_id());
  const auto result = signoff::reports::QueryRows(select(set->tables), filter, page);

  Response resp;
  for (const auto* row : result.rows) {
    Fill(*row, resp.add_rows());
  }
  auto* info = resp.mutable_page();
  info->set_run_id(set->run_id);
  info->set_next_page_token(result.next_page_token);
  info->set_total_size(result.total_size);
  return resp;
}

} // namespace

ReportService::ReportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RunReportsResponse ReportService::RunReports(const RunReportsRequest& req) {
  return ObserveRpc("ReportService.RunReports", "", [&] {
    std::optional<util::TimePoint> as_of;
    if (req.has_as_of()) {
      if (req.as_of().nanos() < 0 || req.as_of().nanos() > 999'999'999) {
        throw util::InvalidArgument("as_of.nanos out of range");
      }
      as_of = util::FromProto(req.as_of());
    }

    RunReportsResponse resp;
    *resp.mutable_run() = ctx_.coordinator->Run(as_of);
    return resp;
  });
}

GetRunResponse ReportService::GetRun(const GetRunRequest& req) {
  return ObserveRpc("ReportService.GetRun", req.run_id(), [&] {
    if (req.run_id().empty()) {
      throw util::InvalidArgument("run_id is required");
    }
    GetRunResponse resp;
    *resp.mutable_run() = ctx_.store->GetRun(req.run_id());
    return resp;
  });
}

ListRunsResponse ReportService::ListRuns(const ListRunsRequest&) {
  return ObserveRpc("ReportService.ListRuns", "", [&] {
    ListRunsResponse resp;
    for (auto& run : ctx_.store->ListRuns()) {
      *resp.add_runs() = std::move(run);
    }
    return resp;
  });
}

ListHistoryResponse ReportService::ListHistory(const RowQuery& req) {
  return ObserveRpc("ReportService.ListHistory", req.run_id(), [&] {
    return QueryReport<ListHistoryResponse>(ctx_, req, [](const compliance::ReportTables& t) -> const auto& { return t.history.rows; });
  });
}

ListQualificationResponse ReportService::ListQualification(const RowQuery& req) {
  return ObserveRpc("ReportService.ListQualification", req.run_id(), [&] {
    return QueryReport<ListQualificationResponse>(ctx_, req,
                                                  [](const compliance::ReportTables& t) -> const auto& { return t.qualification.rows; });
  });
}

ListNeverSignedOffResponse ReportService::ListNeverSignedOff(const RowQuery& req) {
  return ObserveRpc("ReportService.ListNeverSignedOff", req.run_id(), [&] {
    return QueryReport<ListNeverSignedOffResponse>(ctx_, req,
                                                   [](const compliance::ReportTables& t) -> const auto& { return t.never_signed_off.rows; });
  });
}

ListRiskResponse ReportService::ListRisk(const RowQuery& req) {
  return ObserveRpc("ReportService.ListRisk", req.run_id(), [&] {
    return QueryReport<ListRiskResponse>(ctx_, req, [](const compliance::ReportTables& t) -> const auto& { return t.risk.rows; });
  });
}

HealthResponse ReportService::Health(const HealthRequest&) {
  return ObserveRpc("ReportService.Health", "", [&] {
    HealthResponse resp;
    resp.set_serving(true);
    if (auto latest = ctx_.store->LatestCompletedRunId()) {
      resp.set_latest_run_id(*latest);
    }
    resp.set_retained_runs(static_cast<std::uint32_t>(ctx_.store->Size()));
    return resp;
  });
}

} // namespace signoff::service
