#pragma once

#include <vector>

#include "internal/db/model/contract_record.hpp"

namespace signoff::snapshot {
class Snapshot;
}

namespace signoff::compliance {

/*
  Contracts of `universe` whose id appears nowhere in the raw signoff
  event store. Soft-deleted events DO count as presence here, unlike in
  every resolver policy, so a contract whose only events were deleted is
  not reported as never signed off.
*/
std::vector<const db::model::BookingContractRecord*> FindNeverSignedOff(const snapshot::Snapshot&                                   snapshot,
                                                                        const std::vector<const db::model::BookingContractRecord*>& universe);

} // namespace signoff::compliance
