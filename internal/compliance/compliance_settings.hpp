#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace signoff::runtime::config {
class ComplianceConfig;
}

namespace signoff::compliance {

// Value written into every attribution field that has no hierarchy match.
inline constexpr std::string_view kNotAssigned = "Not Assigned";

/*
  Business constants of the four report pipelines.

  The three eligibility windows are independent values and are never
  derived from one another.
*/
struct ComplianceSettings {
  std::string  org_domain         = "cisco.com";
  std::int64_t deferred_method_id = 7;

  std::int64_t overdue_after_days = 90;
  std::int64_t low_risk_max_days  = 60;
  std::int64_t med_risk_max_days  = 90;

  int history_grace_months     = 1;  // end + N calendar months
  int qualification_grace_days = 30; // end + N days
  int risk_min_age_months      = 3;  // start + N calendar months

  static ComplianceSettings Defaults() {
    return {};
  }

  static ComplianceSettings FromConfig(const signoff::runtime::config::ComplianceConfig& config);
};

} // namespace signoff::compliance
