#pragma once

#include <array>

namespace signoff::db::sql {

/*
  Input table DDL, applied by the composition root at startup.

  Dates are ISO "YYYY-MM-DD" text (NULL allowed), timestamps are epoch
  milliseconds. row_seq keeps insertion order for tables without a
  natural key.
*/

inline constexpr std::array<const char*, 8> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS booking_contract (row_seq INTEGER PRIMARY KEY AUTOINCREMENT, booking_contract TEXT NOT NULL, "
    "agreement_start_date TEXT, agreement_end_date TEXT, is_deleted INTEGER NOT NULL DEFAULT 0, account_name TEXT, booking_country TEXT, "
    "booked_theater_id INTEGER, sold_as_service_type_id INTEGER, buying_program_type_id INTEGER, sold_as_pricing_type_id INTEGER, "
    "sold_as_sw_allocation REAL, sold_as_hw_allocation REAL);",
    "CREATE TABLE IF NOT EXISTS signoff (signoff_id INTEGER PRIMARY KEY, booking_contract TEXT NOT NULL, dc_user_id INTEGER, "
    "create_dtm_ms INTEGER NOT NULL, signoff_method_id INTEGER, sign_off_identity_id INTEGER, defer_signoff_reason_id INTEGER, "
    "dc_engagement_id INTEGER, signoff_event_id INTEGER, notes TEXT, is_deleted INTEGER NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS signoff_contract_idx ON signoff(booking_contract);",
    "CREATE TABLE IF NOT EXISTS responsible_user (row_seq INTEGER PRIMARY KEY AUTOINCREMENT, booking_contract TEXT NOT NULL, "
    "dc_user_id INTEGER NOT NULL, is_deleted INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS dc_user (user_id INTEGER PRIMARY KEY, user_title TEXT, cco_id TEXT, is_deleted INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS org_hierarchy (row_seq INTEGER PRIMARY KEY AUTOINCREMENT, emp_cco_id TEXT NOT NULL, emp_cco_id_masked TEXT, "
    "emp_name TEXT, level6_worker_name TEXT, level7_worker_name TEXT, level8_worker_name TEXT, level9_worker_name TEXT, mgr_name TEXT, "
    "theater TEXT);",
    "CREATE TABLE IF NOT EXISTS dimension (kind TEXT NOT NULL, id INTEGER NOT NULL, name TEXT NOT NULL, PRIMARY KEY (kind, id));",
    "CREATE TABLE IF NOT EXISTS calendar_date (calendar_day TEXT PRIMARY KEY, fiscal_qtr_sorted_name TEXT, fiscal_mth_sorted_name TEXT, "
    "cal_week_sorted_short_name TEXT);",
};

inline constexpr std::array<const char*, 8> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS booking_contract (row_seq BIGSERIAL PRIMARY KEY, booking_contract TEXT NOT NULL, "
    "agreement_start_date TEXT, agreement_end_date TEXT, is_deleted BOOLEAN NOT NULL DEFAULT FALSE, account_name TEXT, booking_country TEXT, "
    "booked_theater_id BIGINT, sold_as_service_type_id BIGINT, buying_program_type_id BIGINT, sold_as_pricing_type_id BIGINT, "
    "sold_as_sw_allocation DOUBLE PRECISION, sold_as_hw_allocation DOUBLE PRECISION);",
    "CREATE TABLE IF NOT EXISTS signoff (signoff_id BIGINT PRIMARY KEY, booking_contract TEXT NOT NULL, dc_user_id BIGINT, "
    "create_dtm_ms BIGINT NOT NULL, signoff_method_id BIGINT, sign_off_identity_id BIGINT, defer_signoff_reason_id BIGINT, "
    "dc_engagement_id BIGINT, signoff_event_id BIGINT, notes TEXT, is_deleted BOOLEAN NOT NULL DEFAULT FALSE);",
    "CREATE INDEX IF NOT EXISTS signoff_contract_idx ON signoff(booking_contract);",
    "CREATE TABLE IF NOT EXISTS responsible_user (row_seq BIGSERIAL PRIMARY KEY, booking_contract TEXT NOT NULL, "
    "dc_user_id BIGINT NOT NULL, is_deleted BOOLEAN NOT NULL DEFAULT FALSE);",
    "CREATE TABLE IF NOT EXISTS dc_user (user_id BIGINT PRIMARY KEY, user_title TEXT, cco_id TEXT, is_deleted BOOLEAN NOT NULL DEFAULT FALSE);",
    "CREATE TABLE IF NOT EXISTS org_hierarchy (row_seq BIGSERIAL PRIMARY KEY, emp_cco_id TEXT NOT NULL, emp_cco_id_masked TEXT, "
    "emp_name TEXT, level6_worker_name TEXT, level7_worker_name TEXT, level8_worker_name TEXT, level9_worker_name TEXT, mgr_name TEXT, "
    "theater TEXT);",
    "CREATE TABLE IF NOT EXISTS dimension (kind TEXT NOT NULL, id BIGINT NOT NULL, name TEXT NOT NULL, PRIMARY KEY (kind, id));",
    "CREATE TABLE IF NOT EXISTS calendar_date (calendar_day TEXT PRIMARY KEY, fiscal_qtr_sorted_name TEXT, fiscal_mth_sorted_name TEXT, "
    "cal_week_sorted_short_name TEXT);",
};

} // namespace signoff::db::sql
