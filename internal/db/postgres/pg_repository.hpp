#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace signoff::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace signoff::db::postgres
