#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace signoff::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertContract(Transaction& t, const model::BookingContractRecord& r) {
  if (r.booking_contract.empty()) return Result::Err(ErrorCode::ConstraintViolation, "booking_contract is required");
  TX(t).Mutable().tables.contracts.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertResponsibleUser(Transaction& t, const model::ResponsibleUserRecord& r) {
  if (r.booking_contract.empty()) return Result::Err(ErrorCode::ConstraintViolation, "booking_contract is required");
  TX(t).Mutable().tables.responsible_users.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertSignoff(Transaction& t, const model::SignoffRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.signoff_index.contains(r.signoff_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.signoff_index[r.signoff_id] = s.tables.signoffs.size();
  s.tables.signoffs.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::SoftDeleteSignoff(Transaction& t, std::int64_t signoff_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.signoff_index.find(signoff_id);
  if (it == s.signoff_index.end()) return Result::Err(ErrorCode::NotFound);
  s.tables.signoffs[it->second].is_deleted = true;
  return Result::Ok();
}

Result MemoryRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.user_index.contains(r.user_id)) return Result::Err(ErrorCode::AlreadyExists);
  s.user_index[r.user_id] = s.tables.users.size();
  s.tables.users.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertOrgHierarchy(Transaction& t, const model::OrgHierarchyRecord& r) {
  TX(t).Mutable().tables.org_hierarchy.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertDimension(Transaction& t, const model::DimensionRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = std::make_pair(r.kind, r.id);
  if (s.dimension_index.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  s.dimension_index[key] = s.tables.dimensions.size();
  s.tables.dimensions.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::InsertCalendarDate(Transaction& t, const model::CalendarDateRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.calendar_index.contains(r.date)) return Result::Err(ErrorCode::AlreadyExists);
  s.calendar_index[r.date] = s.tables.calendar.size();
  s.tables.calendar.push_back(r);
  return Result::Ok();
}

model::SnapshotTables MemoryRepository::LoadTables(Transaction& t) {
  return TX(t).View().tables;
}

} // namespace signoff::db::memory
