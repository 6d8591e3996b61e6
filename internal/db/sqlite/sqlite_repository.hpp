#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace signoff::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace signoff::db::sqlite
