#pragma once

#include <cstdint>
#include <string_view>

#include "internal/compliance/compliance_settings.hpp"
#include "internal/util/time.hpp"

namespace signoff::compliance {

inline constexpr std::string_view kSignedOff         = "Signed off";
inline constexpr std::string_view kDeferredSignedOff = "Deferred Signed off";
inline constexpr std::string_view kSignOffOverdue    = "sign_off_overdue";

inline constexpr std::string_view kLowRisk  = "a_low_risk";
inline constexpr std::string_view kMedRisk  = "b_med_risk";
inline constexpr std::string_view kHighRisk = "c_high_risk";

// Calendar days from the UTC date of the event to the as-of date.
std::int64_t ElapsedDays(util::TimePoint event_time, util::TimePoint as_of);

// "sign_off_overdue" past the overdue threshold regardless of method,
// otherwise the method-derived label.
std::string_view QualificationStatus(std::int64_t signoff_method_id, std::int64_t elapsed_days, const ComplianceSettings& settings);

/*
  First match wins:
    0 <= d <= low_max        a_low_risk
    low_max <= d <= med_max  b_med_risk
    d > med_max              c_high_risk
  Negative elapsed days (event after as-of) get no bucket: "".
*/
std::string_view RiskBucket(std::int64_t elapsed_days, const ComplianceSettings& settings);

} // namespace signoff::compliance
