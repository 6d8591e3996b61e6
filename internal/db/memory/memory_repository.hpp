#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace signoff::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertContract(Transaction&, const model::BookingContractRecord&) override;
  Result InsertResponsibleUser(Transaction&, const model::ResponsibleUserRecord&) override;

  Result InsertSignoff(Transaction&, const model::SignoffRecord&) override;
  Result SoftDeleteSignoff(Transaction&, std::int64_t signoff_id) override;

  Result InsertUser(Transaction&, const model::UserRecord&) override;
  Result InsertOrgHierarchy(Transaction&, const model::OrgHierarchyRecord&) override;
  Result InsertDimension(Transaction&, const model::DimensionRecord&) override;
  Result InsertCalendarDate(Transaction&, const model::CalendarDateRecord&) override;

  model::SnapshotTables LoadTables(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    model::SnapshotTables tables;

    // unique keys
    std::unordered_map<std::int64_t, std::size_t>                        signoff_index;
    std::unordered_map<std::int64_t, std::size_t>                        user_index;
    std::map<std::pair<model::DimensionKind, std::int64_t>, std::size_t> dimension_index;
    std::map<util::Date, std::size_t>                                    calendar_index;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace signoff::db::memory
