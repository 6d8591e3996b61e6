#include "pg_pool.hpp"

namespace signoff::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_contract",
               "INSERT INTO booking_contract(booking_contract,agreement_start_date,agreement_end_date,is_deleted,account_name,"
               "booking_country,booked_theater_id,sold_as_service_type_id,buying_program_type_id,sold_as_pricing_type_id,"
               "sold_as_sw_allocation,sold_as_hw_allocation) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");

  conn.prepare("insert_responsible_user", "INSERT INTO responsible_user(booking_contract,dc_user_id,is_deleted) VALUES($1,$2,$3)");

  conn.prepare("insert_signoff",
               "INSERT INTO signoff(signoff_id,booking_contract,dc_user_id,create_dtm_ms,signoff_method_id,sign_off_identity_id,"
               "defer_signoff_reason_id,dc_engagement_id,signoff_event_id,notes,is_deleted) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("soft_delete_signoff", "UPDATE signoff SET is_deleted=TRUE WHERE signoff_id=$1");

  conn.prepare("insert_user", "INSERT INTO dc_user(user_id,user_title,cco_id,is_deleted) VALUES($1,$2,$3,$4)");

  conn.prepare("insert_org_hierarchy",
               "INSERT INTO org_hierarchy(emp_cco_id,emp_cco_id_masked,emp_name,level6_worker_name,level7_worker_name,"
               "level8_worker_name,level9_worker_name,mgr_name,theater) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("insert_dimension", "INSERT INTO dimension(kind,id,name) VALUES($1,$2,$3)");

  conn.prepare("insert_calendar_date",
               "INSERT INTO calendar_date(calendar_day,fiscal_qtr_sorted_name,fiscal_mth_sorted_name,cal_week_sorted_short_name) "
               "VALUES($1,$2,$3,$4)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace signoff::db::postgres
