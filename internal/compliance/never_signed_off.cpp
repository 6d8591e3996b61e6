#include "never_signed_off.hpp"

#include "internal/snapshot/snapshot.hpp"

namespace signoff::compliance {

std::vector<const db::model::BookingContractRecord*> FindNeverSignedOff(const snapshot::Snapshot&                                   snapshot,
                                                                        const std::vector<const db::model::BookingContractRecord*>& universe) {
  const auto& touched = snapshot.ContractsWithAnySignoff();

  std::vector<const db::model::BookingContractRecord*> never;
  for (const auto* contract : universe) {
    if (!touched.contains(contract->booking_contract)) never.push_back(contract);
  }
  return never;
}

} // namespace signoff::compliance
