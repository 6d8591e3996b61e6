#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/compliance/drop_counters.hpp"
#include "internal/compliance/org_attribution.hpp"
#include "internal/util/time.hpp"

namespace signoff::compliance {

// Contract columns shared by the history, never-signed-off and risk reports.
struct ContractLabels {
  std::string booking_contract;
  std::string sold_as_service_name;
  std::string booking_country;
  std::string buying_program_name;
  std::string pricing_model_name;
  std::string booked_theater;
  std::string account_name;
  double      sold_as_sw_allocation = 0.0;
  double      sold_as_hw_allocation = 0.0;

  bool operator==(const ContractLabels&) const = default;
};

// One (contract, event) row; has_signoff is false for the single
// placeholder row of a contract without surviving events.
struct HistoryRow {
  ContractLabels contract;

  bool         has_signoff = false;
  std::int64_t signoff_id  = 0;
  std::string  notes;
  std::string  sign_off_identity;
  std::string  signoff_method;
  std::string  defer_signoff_reason;
  std::string  engagement_name;
  std::int64_t dc_engagement_id = 0;
  std::string  user_title;
  std::string  fiscal_qtr_sorted_name;
  std::string  fiscal_mth_sorted_name;
  std::string  cal_week_sorted_short_name;
  std::optional<util::TimePoint> create_dtm;
  std::int64_t signoff_days_ago = 0;
  std::int64_t dc_user_id       = 0;
  bool         is_last_signoff  = false;

  OrgAttribution org;

  bool operator==(const HistoryRow&) const = default;
};

struct QualificationRow {
  std::string     booking_contract;
  std::string     ibv_method;
  std::string     ibv_identity;
  std::string     ibv_event;
  std::string     notes;
  std::string     qualified_ibv;
  std::int64_t    days_since_last_signoff_event = 0;
  util::TimePoint last_signoff_date{};

  bool operator==(const QualificationRow&) const = default;
};

struct NeverSignedOffRow {
  ContractLabels contract;
  OrgAttribution org;

  bool operator==(const NeverSignedOffRow&) const = default;
};

struct RiskRow {
  ContractLabels  contract;
  OrgAttribution  org;
  std::int64_t    signoff_days_ago = 0;
  std::string     signoff_risk;
  util::TimePoint last_signoff_date{};

  bool operator==(const RiskRow&) const = default;
};

template <typename Row>
struct PipelineResult {
  std::vector<Row> rows;
  std::uint64_t    eligible_contracts = 0;
  DropCounters     drops;
};

} // namespace signoff::compliance
