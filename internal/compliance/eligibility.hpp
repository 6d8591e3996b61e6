#pragma once

#include <optional>
#include <vector>

#include "internal/compliance/compliance_settings.hpp"
#include "internal/compliance/drop_counters.hpp"
#include "internal/db/model/contract_record.hpp"
#include "internal/util/time.hpp"

namespace signoff::snapshot {
class Snapshot;
}

namespace signoff::compliance {

/*
  Per-pipeline eligibility windows.

    kHistory        start <= as_of <= AddMonths(end, history_grace_months)
    kQualification  start <= as_of <= end + qualification_grace_days
    kRisk           AddMonths(start, risk_min_age_months) <= as_of <= end

  Both bounds are inclusive and compared on UTC calendar dates.
*/
enum class EligibilityWindow {
  kHistory,
  kQualification,
  kRisk,
};

struct DateRange {
  util::Date first;
  util::Date last;

  bool Contains(util::Date date) const {
    return first <= date && date <= last;
  }
};

// Inclusive as-of range during which the contract is eligible. nullopt
// when either agreement date is missing.
std::optional<DateRange> EligibleRange(EligibilityWindow window, const db::model::BookingContractRecord& contract,
                                       const ComplianceSettings& settings);

bool IsEligible(EligibilityWindow window, const db::model::BookingContractRecord& contract, util::Date as_of_date,
                const ComplianceSettings& settings);

// Non-deleted snapshot contracts eligible under `window`, in snapshot order.
// Contracts with missing dates and duplicate input rows are counted.
std::vector<const db::model::BookingContractRecord*> SelectUniverse(const snapshot::Snapshot& snapshot, EligibilityWindow window,
                                                                    util::Date as_of_date, const ComplianceSettings& settings,
                                                                    DropCounters& drops);

} // namespace signoff::compliance
