#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/calendar_record.hpp"
#include "internal/db/model/contract_record.hpp"
#include "internal/db/model/dimension_record.hpp"
#include "internal/db/model/signoff_record.hpp"
#include "internal/db/model/snapshot_tables.hpp"
#include "internal/db/model/user_record.hpp"

namespace signoff::db {

/*
  Repository abstraction over the compliance input tables.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - LoadTables() returns every table from one consistent view, in
    insertion order (contracts keep duplicates; the snapshot decides)

  Report computation never writes; inserts exist for loaders, the seed
  path and tests.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Contracts
  // ---------------------------------------------------------------------

  virtual Result InsertContract(Transaction&, const model::BookingContractRecord&) = 0;

  virtual Result InsertResponsibleUser(Transaction&, const model::ResponsibleUserRecord&) = 0;

  // ---------------------------------------------------------------------
  // Signoff events (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertSignoff(Transaction&, const model::SignoffRecord&) = 0;

  virtual Result SoftDeleteSignoff(Transaction&, std::int64_t signoff_id) = 0;

  // ---------------------------------------------------------------------
  // Reference data
  // ---------------------------------------------------------------------

  virtual Result InsertUser(Transaction&, const model::UserRecord&) = 0;

  virtual Result InsertOrgHierarchy(Transaction&, const model::OrgHierarchyRecord&) = 0;

  virtual Result InsertDimension(Transaction&, const model::DimensionRecord&) = 0;

  // Keyed by date; a second row for the same date is AlreadyExists.
  virtual Result InsertCalendarDate(Transaction&, const model::CalendarDateRecord&) = 0;

  // ---------------------------------------------------------------------
  // Snapshot
  // ---------------------------------------------------------------------

  virtual model::SnapshotTables LoadTables(Transaction&) = 0;
};

} // namespace signoff::db
