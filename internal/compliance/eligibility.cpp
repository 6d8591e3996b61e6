#include "eligibility.hpp"

#include "internal/snapshot/snapshot.hpp"

namespace signoff::compliance {

std::optional<DateRange> EligibleRange(EligibilityWindow window, const db::model::BookingContractRecord& contract,
                                       const ComplianceSettings& settings) {
  if (!contract.agreement_start_date || !contract.agreement_end_date) {
    return std::nullopt;
  }

  const auto start = *contract.agreement_start_date;
  const auto end   = *contract.agreement_end_date;

  switch (window) {
    case EligibilityWindow::kHistory:
      return DateRange{start, util::AddMonths(end, settings.history_grace_months)};
    case EligibilityWindow::kQualification:
      return DateRange{start, util::AddDays(end, settings.qualification_grace_days)};
    case EligibilityWindow::kRisk:
      return DateRange{util::AddMonths(start, settings.risk_min_age_months), end};
  }
  return std::nullopt;
}

bool IsEligible(EligibilityWindow window, const db::model::BookingContractRecord& contract, util::Date as_of_date,
                const ComplianceSettings& settings) {
  if (contract.is_deleted) return false;
  auto range = EligibleRange(window, contract, settings);
  return range && range->Contains(as_of_date);
}

std::vector<const db::model::BookingContractRecord*> SelectUniverse(const snapshot::Snapshot& snapshot, EligibilityWindow window,
                                                                    util::Date as_of_date, const ComplianceSettings& settings,
                                                                    DropCounters& drops) {
  drops.Add(kDuplicateContract, snapshot.DuplicateContractRows());

  std::vector<const db::model::BookingContractRecord*> universe;
  for (const auto& contract : snapshot.Contracts()) {
    if (contract.is_deleted) continue;

    auto range = EligibleRange(window, contract, settings);
    if (!range) {
      drops.Add(kInvalidAgreementDates);
      continue;
    }
    if (range->Contains(as_of_date)) {
      universe.push_back(&contract);
    }
  }
  return universe;
}

} // namespace signoff::compliance
