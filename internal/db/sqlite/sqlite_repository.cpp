#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace signoff::db::sqlite {

using signoff::db::ErrorCode;
using signoff::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptionalDate(sqlite3_stmt* st, int idx, const std::optional<util::Date>& d) {
  if (d) {
    BindText(st, idx, util::FormatDate(*d));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

// Unparseable dates load as absent; the contract is then ineligible.
std::optional<util::Date> ColOptionalDate(sqlite3_stmt* st, int col) {
  auto text = ColOptionalText(st, col);
  if (!text) return std::nullopt;
  return util::ParseDate(*text);
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

// Steps a SELECT to completion, invoking `read` per row.
template <typename ReadRow>
void ReadAll(sqlite3* db, const char* sql, ReadRow&& read) {
  auto st = Prepare(db, sql);
  if (!st) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    read(st.get());
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Contracts
// ------------------------------------------------------------------

Result SqliteRepository::InsertContract(Transaction& t, const model::BookingContractRecord& r) {
  auto* db = TX(t).Handle();
  if (r.booking_contract.empty()) return Result::Err(ErrorCode::ConstraintViolation, "booking_contract is required");

  auto st = Prepare(db, sql::INSERT_CONTRACT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.booking_contract);
  BindOptionalDate(st.get(), 2, r.agreement_start_date);
  BindOptionalDate(st.get(), 3, r.agreement_end_date);
  BindBool(st.get(), 4, r.is_deleted);
  BindText(st.get(), 5, r.account_name);
  BindText(st.get(), 6, r.booking_country);
  BindI64(st.get(), 7, r.booked_theater_id);
  BindI64(st.get(), 8, r.sold_as_service_type_id);
  BindI64(st.get(), 9, r.buying_program_type_id);
  BindI64(st.get(), 10, r.sold_as_pricing_type_id);
  BindDouble(st.get(), 11, r.sold_as_sw_allocation);
  BindDouble(st.get(), 12, r.sold_as_hw_allocation);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertResponsibleUser(Transaction& t, const model::ResponsibleUserRecord& r) {
  auto* db = TX(t).Handle();
  if (r.booking_contract.empty()) return Result::Err(ErrorCode::ConstraintViolation, "booking_contract is required");

  auto st = Prepare(db, sql::INSERT_RESPONSIBLE_USER);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.booking_contract);
  BindI64(st.get(), 2, r.dc_user_id);
  BindBool(st.get(), 3, r.is_deleted);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Signoff events
// ------------------------------------------------------------------

Result SqliteRepository::InsertSignoff(Transaction& t, const model::SignoffRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_SIGNOFF);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.signoff_id);
  BindText(st.get(), 2, r.booking_contract);
  BindI64(st.get(), 3, r.dc_user_id);
  BindI64(st.get(), 4, util::ToUnixMillis(r.create_dtm));
  BindI64(st.get(), 5, r.signoff_method_id);
  BindI64(st.get(), 6, r.sign_off_identity_id);
  BindI64(st.get(), 7, r.defer_signoff_reason_id);
  BindI64(st.get(), 8, r.dc_engagement_id);
  BindI64(st.get(), 9, r.signoff_event_id);
  BindText(st.get(), 10, r.notes);
  BindBool(st.get(), 11, r.is_deleted);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SoftDeleteSignoff(Transaction& t, std::int64_t signoff_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::SOFT_DELETE_SIGNOFF);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, signoff_id);
  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Reference data
// ------------------------------------------------------------------

Result SqliteRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_USER);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.user_title);
  BindText(st.get(), 3, r.cco_id);
  BindBool(st.get(), 4, r.is_deleted);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertOrgHierarchy(Transaction& t, const model::OrgHierarchyRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_ORG_HIERARCHY);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.emp_cco_id);
  BindOptionalText(st.get(), 2, r.emp_cco_id_masked);
  BindText(st.get(), 3, r.emp_name);
  BindText(st.get(), 4, r.level6_worker_name);
  BindText(st.get(), 5, r.level7_worker_name);
  BindText(st.get(), 6, r.level8_worker_name);
  BindText(st.get(), 7, r.level9_worker_name);
  BindText(st.get(), 8, r.mgr_name);
  BindText(st.get(), 9, r.theater);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertDimension(Transaction& t, const model::DimensionRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_DIMENSION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, std::string(model::DimensionKindName(r.kind)));
  BindI64(st.get(), 2, r.id);
  BindText(st.get(), 3, r.name);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertCalendarDate(Transaction& t, const model::CalendarDateRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_CALENDAR_DATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, util::FormatDate(r.date));
  BindText(st.get(), 2, r.fiscal_qtr_sorted_name);
  BindText(st.get(), 3, r.fiscal_mth_sorted_name);
  BindText(st.get(), 4, r.cal_week_sorted_short_name);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Snapshot
// ------------------------------------------------------------------

model::SnapshotTables SqliteRepository::LoadTables(Transaction& t) {
  auto* db = TX(t).Handle();

  model::SnapshotTables tables;

  ReadAll(db, sql::SELECT_CONTRACTS, [&](sqlite3_stmt* st) {
    model::BookingContractRecord r;
    r.booking_contract        = ColText(st, 0);
    r.agreement_start_date    = ColOptionalDate(st, 1);
    r.agreement_end_date      = ColOptionalDate(st, 2);
    r.is_deleted              = ColBool(st, 3);
    r.account_name            = ColText(st, 4);
    r.booking_country         = ColText(st, 5);
    r.booked_theater_id       = ColI64(st, 6);
    r.sold_as_service_type_id = ColI64(st, 7);
    r.buying_program_type_id  = ColI64(st, 8);
    r.sold_as_pricing_type_id = ColI64(st, 9);
    r.sold_as_sw_allocation   = ColDouble(st, 10);
    r.sold_as_hw_allocation   = ColDouble(st, 11);
    tables.contracts.push_back(std::move(r));
  });

  ReadAll(db, sql::SELECT_SIGNOFFS, [&](sqlite3_stmt* st) {
    model::SignoffRecord r;
    r.signoff_id              = ColI64(st, 0);
    r.booking_contract        = ColText(st, 1);
    r.dc_user_id              = ColI64(st, 2);
    r.create_dtm              = util::FromUnixMillis(ColI64(st, 3));
    r.signoff_method_id       = ColI64(st, 4);
    r.sign_off_identity_id    = ColI64(st, 5);
    r.defer_signoff_reason_id = ColI64(st, 6);
    r.dc_engagement_id        = ColI64(st, 7);
    r.signoff_event_id        = ColI64(st, 8);
    r.notes                   = ColText(st, 9);
    r.is_deleted              = ColBool(st, 10);
    tables.signoffs.push_back(std::move(r));
  });

  ReadAll(db, sql::SELECT_RESPONSIBLE_USERS, [&](sqlite3_stmt* st) {
    model::ResponsibleUserRecord r;
    r.booking_contract = ColText(st, 0);
    r.dc_user_id       = ColI64(st, 1);
    r.is_deleted       = ColBool(st, 2);
    tables.responsible_users.push_back(std::move(r));
  });

  ReadAll(db, sql::SELECT_USERS, [&](sqlite3_stmt* st) {
    model::UserRecord r;
    r.user_id    = ColI64(st, 0);
    r.user_title = ColText(st, 1);
    r.cco_id     = ColText(st, 2);
    r.is_deleted = ColBool(st, 3);
    tables.users.push_back(std::move(r));
  });

  ReadAll(db, sql::SELECT_ORG_HIERARCHY, [&](sqlite3_stmt* st) {
    model::OrgHierarchyRecord r;
    r.emp_cco_id         = ColText(st, 0);
    r.emp_cco_id_masked  = ColOptionalText(st, 1);
    r.emp_name           = ColText(st, 2);
    r.level6_worker_name = ColText(st, 3);
    r.level7_worker_name = ColText(st, 4);
    r.level8_worker_name = ColText(st, 5);
    r.level9_worker_name = ColText(st, 6);
    r.mgr_name           = ColText(st, 7);
    r.theater            = ColText(st, 8);
    tables.org_hierarchy.push_back(std::move(r));
  });

  ReadAll(db, sql::SELECT_DIMENSIONS, [&](sqlite3_stmt* st) {
    auto kind = model::ParseDimensionKind(ColText(st, 0));
    if (!kind) return; // rows of kinds this build does not know
    model::DimensionRecord r;
    r.kind = *kind;
    r.id   = ColI64(st, 1);
    r.name = ColText(st, 2);
    tables.dimensions.push_back(std::move(r));
  });

  ReadAll(db, sql::SELECT_CALENDAR, [&](sqlite3_stmt* st) {
    auto date = util::ParseDate(ColText(st, 0));
    if (!date) return; // a row that cannot match any event date
    model::CalendarDateRecord r;
    r.date                       = *date;
    r.fiscal_qtr_sorted_name     = ColText(st, 1);
    r.fiscal_mth_sorted_name     = ColText(st, 2);
    r.cal_week_sorted_short_name = ColText(st, 3);
    tables.calendar.push_back(std::move(r));
  });

  return tables;
}

} // namespace signoff::db::sqlite
