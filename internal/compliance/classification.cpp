#include "classification.hpp"

namespace signoff::compliance {

std::int64_t ElapsedDays(util::TimePoint event_time, util::TimePoint as_of) {
  return util::DaysBetween(event_time, as_of);
}

std::string_view QualificationStatus(std::int64_t signoff_method_id, std::int64_t elapsed_days, const ComplianceSettings& settings) {
  const auto base_status = signoff_method_id == settings.deferred_method_id ? kDeferredSignedOff : kSignedOff;
  if (elapsed_days > settings.overdue_after_days) return kSignOffOverdue;
  return base_status;
}

std::string_view RiskBucket(std::int64_t elapsed_days, const ComplianceSettings& settings) {
  if (0 <= elapsed_days && elapsed_days <= settings.low_risk_max_days) return kLowRisk;
  if (settings.low_risk_max_days <= elapsed_days && elapsed_days <= settings.med_risk_max_days) return kMedRisk;
  if (elapsed_days > settings.med_risk_max_days) return kHighRisk;
  return {};
}

} // namespace signoff::compliance
