#pragma once

namespace signoff::db::sql {

/*
  Canonical SQL used by the SQLite backend. The Postgres backend prepares
  the same statements with $n placeholders (see PgPool).

  SELECT column order is fixed; row readers index columns by position.
*/

// contracts

static constexpr const char* INSERT_CONTRACT =
    "INSERT INTO booking_contract(booking_contract,agreement_start_date,agreement_end_date,is_deleted,account_name,booking_country,"
    "booked_theater_id,sold_as_service_type_id,buying_program_type_id,sold_as_pricing_type_id,sold_as_sw_allocation,sold_as_hw_allocation)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CONTRACTS =
    "SELECT booking_contract,agreement_start_date,agreement_end_date,is_deleted,account_name,booking_country,"
    "booked_theater_id,sold_as_service_type_id,buying_program_type_id,sold_as_pricing_type_id,sold_as_sw_allocation,sold_as_hw_allocation"
    " FROM booking_contract ORDER BY row_seq;";

static constexpr const char* INSERT_RESPONSIBLE_USER =
    "INSERT INTO responsible_user(booking_contract,dc_user_id,is_deleted) VALUES(?,?,?);";

static constexpr const char* SELECT_RESPONSIBLE_USERS =
    "SELECT booking_contract,dc_user_id,is_deleted FROM responsible_user ORDER BY row_seq;";

// signoff events

static constexpr const char* INSERT_SIGNOFF =
    "INSERT INTO signoff(signoff_id,booking_contract,dc_user_id,create_dtm_ms,signoff_method_id,sign_off_identity_id,"
    "defer_signoff_reason_id,dc_engagement_id,signoff_event_id,notes,is_deleted)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SOFT_DELETE_SIGNOFF =
    "UPDATE signoff SET is_deleted=1 WHERE signoff_id=?;";

static constexpr const char* SELECT_SIGNOFFS =
    "SELECT signoff_id,booking_contract,dc_user_id,create_dtm_ms,signoff_method_id,sign_off_identity_id,"
    "defer_signoff_reason_id,dc_engagement_id,signoff_event_id,notes,is_deleted"
    " FROM signoff ORDER BY signoff_id;";

// reference data

static constexpr const char* INSERT_USER =
    "INSERT INTO dc_user(user_id,user_title,cco_id,is_deleted) VALUES(?,?,?,?);";

static constexpr const char* SELECT_USERS =
    "SELECT user_id,user_title,cco_id,is_deleted FROM dc_user ORDER BY user_id;";

static constexpr const char* INSERT_ORG_HIERARCHY =
    "INSERT INTO org_hierarchy(emp_cco_id,emp_cco_id_masked,emp_name,level6_worker_name,level7_worker_name,"
    "level8_worker_name,level9_worker_name,mgr_name,theater)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ORG_HIERARCHY =
    "SELECT emp_cco_id,emp_cco_id_masked,emp_name,level6_worker_name,level7_worker_name,"
    "level8_worker_name,level9_worker_name,mgr_name,theater"
    " FROM org_hierarchy ORDER BY row_seq;";

static constexpr const char* INSERT_DIMENSION =
    "INSERT INTO dimension(kind,id,name) VALUES(?,?,?);";

static constexpr const char* SELECT_DIMENSIONS =
    "SELECT kind,id,name FROM dimension ORDER BY kind,id;";

static constexpr const char* INSERT_CALENDAR_DATE =
    "INSERT INTO calendar_date(calendar_day,fiscal_qtr_sorted_name,fiscal_mth_sorted_name,cal_week_sorted_short_name) VALUES(?,?,?,?);";

static constexpr const char* SELECT_CALENDAR =
    "SELECT calendar_day,fiscal_qtr_sorted_name,fiscal_mth_sorted_name,cal_week_sorted_short_name FROM calendar_date ORDER BY calendar_day;";

} // namespace signoff::db::sql
