#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/db/model/snapshot_tables.hpp"

namespace signoff::snapshot {

/*
  Snapshot

  Immutable, indexed view of every input table for one report run.
  Built once from the repository inside a single transaction and then
  shared read-only (std::shared_ptr<const Snapshot>) by all pipelines.

  Contracts are deduplicated by booking_contract. The first non-deleted
  row wins (the first row when all are deleted) and keeps the position of
  the id's first occurrence; the number of discarded rows is reported.
*/
class Snapshot {
 public:
  explicit Snapshot(db::model::SnapshotTables tables);

  Snapshot(const Snapshot&)            = delete;
  Snapshot& operator=(const Snapshot&) = delete;

  const std::vector<db::model::BookingContractRecord>& Contracts() const {
    return contracts_;
  }

  std::uint64_t DuplicateContractRows() const {
    return duplicate_contract_rows_;
  }

  // Non-deleted events of a contract, in storage order.
  const std::vector<const db::model::SignoffRecord*>& LiveSignoffs(const std::string& booking_contract) const;

  // Contract ids present in the raw event store, soft-deleted events included.
  const std::unordered_set<std::string>& ContractsWithAnySignoff() const {
    return contracts_with_any_signoff_;
  }

  // Non-deleted responsible user ids of a contract, in storage order.
  const std::vector<std::int64_t>& ResponsibleUsers(const std::string& booking_contract) const;

  std::optional<std::string_view> DimensionName(db::model::DimensionKind kind, std::int64_t id) const;

  // Date dimension row for one UTC calendar date.
  const db::model::CalendarDateRecord* FindCalendarDate(util::Date date) const;

  // Any user row, deleted or not.
  const db::model::UserRecord* FindUser(std::int64_t user_id) const;

  const std::vector<db::model::UserRecord>& Users() const {
    return tables_.users;
  }

  const std::vector<db::model::OrgHierarchyRecord>& OrgHierarchy() const {
    return tables_.org_hierarchy;
  }

  std::size_t SignoffCount() const {
    return tables_.signoffs.size();
  }

 private:
  db::model::SnapshotTables                          tables_;
  std::vector<db::model::BookingContractRecord>      contracts_;
  std::uint64_t                                      duplicate_contract_rows_ = 0;

  std::unordered_map<std::string, std::vector<const db::model::SignoffRecord*>> live_signoffs_;
  std::unordered_set<std::string>                                               contracts_with_any_signoff_;
  std::unordered_map<std::string, std::vector<std::int64_t>>                    responsible_users_;
  std::map<std::pair<db::model::DimensionKind, std::int64_t>, std::string>      dimensions_;
  std::unordered_map<std::int64_t, const db::model::UserRecord*>                users_;
  std::map<util::Date, const db::model::CalendarDateRecord*>                    calendar_;
};

} // namespace signoff::snapshot
