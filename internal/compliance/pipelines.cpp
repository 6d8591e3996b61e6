#include "pipelines.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <tuple>

#include "internal/compliance/classification.hpp"
#include "internal/compliance/eligibility.hpp"
#include "internal/compliance/event_resolver.hpp"
#include "internal/compliance/never_signed_off.hpp"
#include "internal/snapshot/snapshot.hpp"

namespace signoff::compliance {

using db::model::DimensionKind;

namespace {

// Inner join of one dimension; a miss is counted and yields nullopt.
std::optional<std::string> JoinDimension(const snapshot::Snapshot& snapshot, DimensionKind kind, std::int64_t id, DropCounters& drops) {
  auto name = snapshot.DimensionName(kind, id);
  if (!name) {
    drops.AddMissing(kind);
    return std::nullopt;
  }
  return std::string(*name);
}

// Service type, buying program, theater and pricing model labels. A
// contract missing any of them is dropped; only the first miss is counted.
std::optional<ContractLabels> ResolveContractLabels(const snapshot::Snapshot& snapshot, const db::model::BookingContractRecord& contract,
                                                    DropCounters& drops) {
  auto service_type = JoinDimension(snapshot, DimensionKind::ServiceType, contract.sold_as_service_type_id, drops);
  if (!service_type) return std::nullopt;
  auto buying_program = JoinDimension(snapshot, DimensionKind::BuyingProgram, contract.buying_program_type_id, drops);
  if (!buying_program) return std::nullopt;
  auto theater = JoinDimension(snapshot, DimensionKind::Theater, contract.booked_theater_id, drops);
  if (!theater) return std::nullopt;
  auto pricing_model = JoinDimension(snapshot, DimensionKind::PricingModel, contract.sold_as_pricing_type_id, drops);
  if (!pricing_model) return std::nullopt;

  ContractLabels labels;
  labels.booking_contract      = contract.booking_contract;
  labels.sold_as_service_name  = std::move(*service_type);
  labels.booking_country       = contract.booking_country;
  labels.buying_program_name   = std::move(*buying_program);
  labels.pricing_model_name    = std::move(*pricing_model);
  labels.booked_theater        = std::move(*theater);
  labels.account_name          = contract.account_name;
  labels.sold_as_sw_allocation = contract.sold_as_sw_allocation;
  labels.sold_as_hw_allocation = contract.sold_as_hw_allocation;
  return labels;
}

// One attribution per non-deleted responsible user, or the sentinel once.
template <typename Emit>
void ForEachResponsibleAttribution(const PipelineContext& ctx, const std::string& booking_contract, Emit&& emit) {
  const auto& users = ctx.snapshot.ResponsibleUsers(booking_contract);
  if (users.empty()) {
    emit(OrgAttribution::Sentinel());
    return;
  }
  for (auto user_id : users) {
    emit(ctx.attribution.Resolve(user_id));
  }
}

std::optional<HistoryRow> BuildHistoryRow(const PipelineContext& ctx, const ContractLabels& labels, const AnnotatedSignoff& annotated,
                                          DropCounters& drops) {
  const auto& event    = *annotated.event;
  const auto& snapshot = ctx.snapshot;

  auto method = JoinDimension(snapshot, DimensionKind::SignoffMethod, event.signoff_method_id, drops);
  if (!method) return std::nullopt;
  auto identity = JoinDimension(snapshot, DimensionKind::SignOffIdentity, event.sign_off_identity_id, drops);
  if (!identity) return std::nullopt;
  auto defer_reason = JoinDimension(snapshot, DimensionKind::DeferSignoffReason, event.defer_signoff_reason_id, drops);
  if (!defer_reason) return std::nullopt;
  auto engagement = JoinDimension(snapshot, DimensionKind::Engagement, event.dc_engagement_id, drops);
  if (!engagement) return std::nullopt;
  const auto* user = snapshot.FindUser(event.dc_user_id);
  if (!user) {
    drops.Add(kMissingUser);
    return std::nullopt;
  }
  const auto* day = snapshot.FindCalendarDate(util::ToDate(event.create_dtm));
  if (!day) {
    drops.Add(kMissingDate);
    return std::nullopt;
  }

  HistoryRow row;
  row.contract                   = labels;
  row.has_signoff                = true;
  row.signoff_id                 = event.signoff_id;
  row.notes                      = event.notes;
  row.sign_off_identity          = std::move(*identity);
  row.signoff_method             = std::move(*method);
  row.defer_signoff_reason       = std::move(*defer_reason);
  row.engagement_name            = std::move(*engagement);
  row.dc_engagement_id           = event.dc_engagement_id;
  row.user_title                 = user->user_title;
  row.fiscal_qtr_sorted_name     = day->fiscal_qtr_sorted_name;
  row.fiscal_mth_sorted_name     = day->fiscal_mth_sorted_name;
  row.cal_week_sorted_short_name = day->cal_week_sorted_short_name;
  row.create_dtm                 = event.create_dtm;
  row.signoff_days_ago           = ElapsedDays(event.create_dtm, ctx.as_of);
  row.dc_user_id                 = event.dc_user_id;
  row.is_last_signoff            = annotated.is_last_signoff;
  row.org                        = ctx.attribution.Resolve(event.dc_user_id);
  return row;
}

} // namespace

PipelineResult<HistoryRow> RunHistoryPipeline(const PipelineContext& ctx) {
  PipelineResult<HistoryRow> result;
  const auto                 as_of_date = util::ToDate(ctx.as_of);
  const auto universe = SelectUniverse(ctx.snapshot, EligibilityWindow::kHistory, as_of_date, ctx.settings, result.drops);
  result.eligible_contracts = universe.size();

  for (const auto* contract : universe) {
    auto labels = ResolveContractLabels(ctx.snapshot, *contract, result.drops);
    if (!labels) continue;

    bool emitted = false;
    for (const auto& annotated : AnnotateLatest(ctx.snapshot.LiveSignoffs(contract->booking_contract), ctx.settings.deferred_method_id)) {
      auto row = BuildHistoryRow(ctx, *labels, annotated, result.drops);
      if (!row) continue;
      result.rows.push_back(std::move(*row));
      emitted = true;
    }

    if (!emitted) {
      HistoryRow row;
      row.contract = *labels;
      row.org      = OrgAttribution::Sentinel();
      result.rows.push_back(std::move(row));
    }
  }

  std::sort(result.rows.begin(), result.rows.end(), [](const HistoryRow& a, const HistoryRow& b) {
    return std::tie(a.contract.booking_contract, a.create_dtm, a.dc_user_id, a.signoff_id) <
           std::tie(b.contract.booking_contract, b.create_dtm, b.dc_user_id, b.signoff_id);
  });
  return result;
}

PipelineResult<QualificationRow> RunQualificationPipeline(const PipelineContext& ctx) {
  PipelineResult<QualificationRow> result;
  const auto                       as_of_date = util::ToDate(ctx.as_of);
  const auto universe = SelectUniverse(ctx.snapshot, EligibilityWindow::kQualification, as_of_date, ctx.settings, result.drops);
  result.eligible_contracts = universe.size();

  for (const auto* contract : universe) {
    const auto latest = SelectLatestAnyMethod(ctx.snapshot.LiveSignoffs(contract->booking_contract));
    if (latest.empty()) continue;
    if (!ResolveContractLabels(ctx.snapshot, *contract, result.drops)) continue;

    for (const auto* event : latest) {
      auto method = JoinDimension(ctx.snapshot, DimensionKind::SignoffMethod, event->signoff_method_id, result.drops);
      if (!method) continue;
      auto identity = JoinDimension(ctx.snapshot, DimensionKind::SignOffIdentity, event->sign_off_identity_id, result.drops);
      if (!identity) continue;
      auto event_type = JoinDimension(ctx.snapshot, DimensionKind::SignoffEventType, event->signoff_event_id, result.drops);
      if (!event_type) continue;

      const auto elapsed = ElapsedDays(event->create_dtm, ctx.as_of);

      QualificationRow row;
      row.booking_contract              = contract->booking_contract;
      row.ibv_method                    = std::move(*method);
      row.ibv_identity                  = std::move(*identity);
      row.ibv_event                     = std::move(*event_type);
      row.notes                         = event->notes;
      row.qualified_ibv                 = std::string(QualificationStatus(event->signoff_method_id, elapsed, ctx.settings));
      row.days_since_last_signoff_event = elapsed;
      row.last_signoff_date             = event->create_dtm;
      result.rows.push_back(std::move(row));
    }
  }

  auto key = [](const QualificationRow& r) {
    return std::tie(r.booking_contract, r.last_signoff_date, r.ibv_method, r.ibv_identity, r.ibv_event, r.notes, r.qualified_ibv,
                    r.days_since_last_signoff_event);
  };
  std::sort(result.rows.begin(), result.rows.end(), [&](const QualificationRow& a, const QualificationRow& b) { return key(a) < key(b); });
  result.rows.erase(std::unique(result.rows.begin(), result.rows.end()), result.rows.end());
  return result;
}

PipelineResult<NeverSignedOffRow> RunNeverSignedOffPipeline(const PipelineContext& ctx) {
  PipelineResult<NeverSignedOffRow> result;
  const auto                        as_of_date = util::ToDate(ctx.as_of);
  const auto universe = SelectUniverse(ctx.snapshot, EligibilityWindow::kHistory, as_of_date, ctx.settings, result.drops);
  result.eligible_contracts = universe.size();

  for (const auto* contract : FindNeverSignedOff(ctx.snapshot, universe)) {
    auto labels = ResolveContractLabels(ctx.snapshot, *contract, result.drops);
    if (!labels) continue;

    ForEachResponsibleAttribution(ctx, contract->booking_contract, [&](const OrgAttribution& org) {
      result.rows.push_back(NeverSignedOffRow{*labels, org});
    });
  }

  std::stable_sort(result.rows.begin(), result.rows.end(), [](const NeverSignedOffRow& a, const NeverSignedOffRow& b) {
    return a.contract.booking_contract < b.contract.booking_contract;
  });
  return result;
}

PipelineResult<RiskRow> RunRiskPipeline(const PipelineContext& ctx) {
  PipelineResult<RiskRow> result;
  const auto              as_of_date = util::ToDate(ctx.as_of);
  const auto universe = SelectUniverse(ctx.snapshot, EligibilityWindow::kRisk, as_of_date, ctx.settings, result.drops);
  result.eligible_contracts = universe.size();

  for (const auto* contract : universe) {
    const auto last_signoff =
        LatestNonDeferredTimestamp(ctx.snapshot.LiveSignoffs(contract->booking_contract), ctx.settings.deferred_method_id);
    if (!last_signoff) continue;

    auto labels = ResolveContractLabels(ctx.snapshot, *contract, result.drops);
    if (!labels) continue;

    const auto elapsed = ElapsedDays(*last_signoff, ctx.as_of);
    const auto risk    = std::string(RiskBucket(elapsed, ctx.settings));

    ForEachResponsibleAttribution(ctx, contract->booking_contract, [&](const OrgAttribution& org) {
      result.rows.push_back(RiskRow{*labels, org, elapsed, risk, *last_signoff});
    });
  }

  std::stable_sort(result.rows.begin(), result.rows.end(),
                   [](const RiskRow& a, const RiskRow& b) { return a.contract.booking_contract < b.contract.booking_contract; });
  return result;
}

} // namespace signoff::compliance
