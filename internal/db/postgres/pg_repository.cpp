#include "pg_repository.hpp"

#include <optional>
#include <string>

namespace signoff::db::postgres {

namespace {

std::optional<std::string> DateParam(const std::optional<util::Date>& date) {
  if (!date) return std::nullopt;
  return util::FormatDate(*date);
}

std::string FieldText(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

std::optional<std::string> FieldOptionalText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<util::Date> FieldOptionalDate(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return util::ParseDate(f.c_str());
}

std::int64_t FieldI64(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<std::int64_t>();
}

double FieldDouble(const pqxx::field& f) {
  return f.is_null() ? 0.0 : f.as<double>();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertContract(Transaction& t, const model::BookingContractRecord& r) {
  if (r.booking_contract.empty()) return Result::Err(ErrorCode::ConstraintViolation, "booking_contract is required");
  try {
    TX(t).Work().exec_prepared("insert_contract", r.booking_contract, DateParam(r.agreement_start_date), DateParam(r.agreement_end_date),
                               r.is_deleted, r.account_name, r.booking_country, r.booked_theater_id, r.sold_as_service_type_id,
                               r.buying_program_type_id, r.sold_as_pricing_type_id, r.sold_as_sw_allocation, r.sold_as_hw_allocation);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertResponsibleUser(Transaction& t, const model::ResponsibleUserRecord& r) {
  if (r.booking_contract.empty()) return Result::Err(ErrorCode::ConstraintViolation, "booking_contract is required");
  try {
    TX(t).Work().exec_prepared("insert_responsible_user", r.booking_contract, r.dc_user_id, r.is_deleted);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSignoff(Transaction& t, const model::SignoffRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_signoff", r.signoff_id, r.booking_contract, r.dc_user_id, util::ToUnixMillis(r.create_dtm),
                               r.signoff_method_id, r.sign_off_identity_id, r.defer_signoff_reason_id, r.dc_engagement_id,
                               r.signoff_event_id, r.notes, r.is_deleted);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SoftDeleteSignoff(Transaction& t, std::int64_t signoff_id) {
  try {
    auto res = TX(t).Work().exec_prepared("soft_delete_signoff", signoff_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertUser(Transaction& t, const model::UserRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_user", r.user_id, r.user_title, r.cco_id, r.is_deleted);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertOrgHierarchy(Transaction& t, const model::OrgHierarchyRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_org_hierarchy", r.emp_cco_id, r.emp_cco_id_masked, r.emp_name, r.level6_worker_name,
                               r.level7_worker_name, r.level8_worker_name, r.level9_worker_name, r.mgr_name, r.theater);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertDimension(Transaction& t, const model::DimensionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_dimension", std::string(model::DimensionKindName(r.kind)), r.id, r.name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertCalendarDate(Transaction& t, const model::CalendarDateRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_calendar_date", util::FormatDate(r.date), r.fiscal_qtr_sorted_name, r.fiscal_mth_sorted_name,
                               r.cal_week_sorted_short_name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::SnapshotTables PgRepository::LoadTables(Transaction& t) {
  auto& work = TX(t).Work();

  model::SnapshotTables tables;

  auto contracts = work.exec(
      "SELECT booking_contract,agreement_start_date,agreement_end_date,is_deleted,account_name,booking_country,"
      "booked_theater_id,sold_as_service_type_id,buying_program_type_id,sold_as_pricing_type_id,sold_as_sw_allocation,"
      "sold_as_hw_allocation FROM booking_contract ORDER BY row_seq;");
  tables.contracts.reserve(contracts.size());
  for (const auto& row : contracts) {
    model::BookingContractRecord r;
    r.booking_contract        = FieldText(row[0]);
    r.agreement_start_date    = FieldOptionalDate(row[1]);
    r.agreement_end_date      = FieldOptionalDate(row[2]);
    r.is_deleted              = row[3].as<bool>();
    r.account_name            = FieldText(row[4]);
    r.booking_country         = FieldText(row[5]);
    r.booked_theater_id       = FieldI64(row[6]);
    r.sold_as_service_type_id = FieldI64(row[7]);
    r.buying_program_type_id  = FieldI64(row[8]);
    r.sold_as_pricing_type_id = FieldI64(row[9]);
    r.sold_as_sw_allocation   = FieldDouble(row[10]);
    r.sold_as_hw_allocation   = FieldDouble(row[11]);
    tables.contracts.push_back(std::move(r));
  }

  auto signoffs = work.exec(
      "SELECT signoff_id,booking_contract,dc_user_id,create_dtm_ms,signoff_method_id,sign_off_identity_id,"
      "defer_signoff_reason_id,dc_engagement_id,signoff_event_id,notes,is_deleted FROM signoff ORDER BY signoff_id;");
  tables.signoffs.reserve(signoffs.size());
  for (const auto& row : signoffs) {
    model::SignoffRecord r;
    r.signoff_id              = row[0].as<std::int64_t>();
    r.booking_contract        = FieldText(row[1]);
    r.dc_user_id              = FieldI64(row[2]);
    r.create_dtm              = util::FromUnixMillis(row[3].as<std::int64_t>());
    r.signoff_method_id       = FieldI64(row[4]);
    r.sign_off_identity_id    = FieldI64(row[5]);
    r.defer_signoff_reason_id = FieldI64(row[6]);
    r.dc_engagement_id        = FieldI64(row[7]);
    r.signoff_event_id        = FieldI64(row[8]);
    r.notes                   = FieldText(row[9]);
    r.is_deleted              = row[10].as<bool>();
    tables.signoffs.push_back(std::move(r));
  }

  auto responsible = work.exec("SELECT booking_contract,dc_user_id,is_deleted FROM responsible_user ORDER BY row_seq;");
  tables.responsible_users.reserve(responsible.size());
  for (const auto& row : responsible) {
    model::ResponsibleUserRecord r;
    r.booking_contract = FieldText(row[0]);
    r.dc_user_id       = row[1].as<std::int64_t>();
    r.is_deleted       = row[2].as<bool>();
    tables.responsible_users.push_back(std::move(r));
  }

  auto users = work.exec("SELECT user_id,user_title,cco_id,is_deleted FROM dc_user ORDER BY user_id;");
  tables.users.reserve(users.size());
  for (const auto& row : users) {
    model::UserRecord r;
    r.user_id    = row[0].as<std::int64_t>();
    r.user_title = FieldText(row[1]);
    r.cco_id     = FieldText(row[2]);
    r.is_deleted = row[3].as<bool>();
    tables.users.push_back(std::move(r));
  }

  auto hierarchy = work.exec(
      "SELECT emp_cco_id,emp_cco_id_masked,emp_name,level6_worker_name,level7_worker_name,level8_worker_name,"
      "level9_worker_name,mgr_name,theater FROM org_hierarchy ORDER BY row_seq;");
  tables.org_hierarchy.reserve(hierarchy.size());
  for (const auto& row : hierarchy) {
    model::OrgHierarchyRecord r;
    r.emp_cco_id         = FieldText(row[0]);
    r.emp_cco_id_masked  = FieldOptionalText(row[1]);
    r.emp_name           = FieldText(row[2]);
    r.level6_worker_name = FieldText(row[3]);
    r.level7_worker_name = FieldText(row[4]);
    r.level8_worker_name = FieldText(row[5]);
    r.level9_worker_name = FieldText(row[6]);
    r.mgr_name           = FieldText(row[7]);
    r.theater            = FieldText(row[8]);
    tables.org_hierarchy.push_back(std::move(r));
  }

  auto dimensions = work.exec("SELECT kind,id,name FROM dimension ORDER BY kind,id;");
  for (const auto& row : dimensions) {
    auto kind = model::ParseDimensionKind(FieldText(row[0]));
    if (!kind) continue;
    model::DimensionRecord r;
    r.kind = *kind;
    r.id   = row[1].as<std::int64_t>();
    r.name = FieldText(row[2]);
    tables.dimensions.push_back(std::move(r));
  }

  auto calendar = work.exec(
      "SELECT calendar_day,fiscal_qtr_sorted_name,fiscal_mth_sorted_name,cal_week_sorted_short_name FROM calendar_date ORDER BY calendar_day;");
  tables.calendar.reserve(calendar.size());
  for (const auto& row : calendar) {
    auto date = util::ParseDate(FieldText(row[0]));
    if (!date) continue;
    model::CalendarDateRecord r;
    r.date                       = *date;
    r.fiscal_qtr_sorted_name     = FieldText(row[1]);
    r.fiscal_mth_sorted_name     = FieldText(row[2]);
    r.cal_week_sorted_short_name = FieldText(row[3]);
    tables.calendar.push_back(std::move(r));
  }

  return tables;
}

} // namespace signoff::db::postgres
