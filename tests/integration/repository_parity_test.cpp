#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "tests/unit/sample_fixture.hpp"
#include "internal/compliance/report_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/seed/fixture_loader.hpp"
#include "internal/snapshot/snapshot.hpp"
#include "internal/util/errors.hpp"

#if SIGNOFF_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SIGNOFF_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using signoff::db::ErrorCode;
using signoff::db::Repository;
using signoff::db::memory::MemoryRepository;
using namespace signoff::db::model;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

const auto kAsOf = *signoff::util::ParseTimestamp("2024-06-15T00:00:00Z");

// Backends return rows in their own storage order; compare by key.
template <typename Row, typename Key>
std::vector<Row> SortedBy(std::vector<Row> rows, Key key) {
  std::stable_sort(rows.begin(), rows.end(), [&](const Row& a, const Row& b) { return key(a) < key(b); });
  return rows;
}

void VerifyFixtureRoundTrip(Repository& repo) {
  const auto stats = signoff::seed::FixtureLoader::LoadString(repo, signoff::testing::kSampleFixture);
  assert(stats.contracts == 3);
  assert(stats.signoffs == 3);
  assert(stats.dimensions == 10);

  auto tx     = repo.Begin();
  auto tables = repo.LoadTables(*tx);
  tx->Commit();

  assert(tables.contracts.size() == 3);
  assert(tables.contracts[0].booking_contract == "C1");
  assert(tables.contracts[0].agreement_end_date == signoff::util::ParseDate("2024-12-31"));
  assert(tables.contracts[0].sold_as_sw_allocation == 0.4);
  assert(tables.contracts[1].booking_country == "DE");

  const auto signoffs = SortedBy(tables.signoffs, [](const SignoffRecord& r) { return r.signoff_id; });
  assert(signoffs.size() == 3);
  assert(signoffs[1].create_dtm == *signoff::util::ParseTimestamp("2024-05-20T09:00:00Z"));
  assert(signoffs[1].notes == "second");
  assert(!signoffs[1].is_deleted);

  assert(tables.users.size() == 1);
  assert(tables.users[0].cco_id == "alice@cisco.com");
  assert(tables.org_hierarchy.size() == 1);
  assert(tables.org_hierarchy[0].emp_cco_id_masked == std::optional<std::string>("M-10"));
  assert(tables.responsible_users.size() == 1);
  assert(tables.dimensions.size() == 10);
  assert(tables.calendar.size() == 3);
  assert(tables.calendar[0].date == *signoff::util::ParseDate("2024-03-01"));
  assert(tables.calendar[0].fiscal_qtr_sorted_name == "FY2024 Q3");
  assert(tables.calendar[2].cal_week_sorted_short_name == "2024 W22");
}

void VerifyNullableColumns(Repository& repo) {
  auto tx = repo.Begin();

  BookingContractRecord open_ended;
  open_ended.booking_contract     = "N1";
  open_ended.agreement_start_date = signoff::util::ParseDate("2024-01-01");
  assert(repo.InsertContract(*tx, open_ended));

  OrgHierarchyRecord unmasked;
  unmasked.emp_cco_id = "nomask";
  assert(repo.InsertOrgHierarchy(*tx, unmasked));
  tx->Commit();

  auto read   = repo.Begin();
  auto tables = repo.LoadTables(*read);
  read->Commit();

  auto contract = std::find_if(tables.contracts.begin(), tables.contracts.end(), [](const auto& c) { return c.booking_contract == "N1"; });
  assert(contract != tables.contracts.end());
  assert(contract->agreement_start_date.has_value());
  assert(!contract->agreement_end_date.has_value());

  auto entry = std::find_if(tables.org_hierarchy.begin(), tables.org_hierarchy.end(), [](const auto& e) { return e.emp_cco_id == "nomask"; });
  assert(entry != tables.org_hierarchy.end());
  assert(!entry->emp_cco_id_masked.has_value());
}

void VerifyUniqueKeys(Repository& repo) {
  auto tx = repo.Begin();

  SignoffRecord duplicate;
  duplicate.signoff_id       = 1;
  duplicate.booking_contract = "C1";
  duplicate.create_dtm       = kAsOf;
  auto result                = repo.InsertSignoff(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();

  auto dim_tx = repo.Begin();
  auto dim    = repo.InsertDimension(*dim_tx, DimensionRecord{DimensionKind::Theater, 1, "Again"});
  assert(dim.code == ErrorCode::AlreadyExists);
  dim_tx->Rollback();

  auto day_tx = repo.Begin();
  CalendarDateRecord day;
  day.date = *signoff::util::ParseDate("2024-03-01");
  assert(repo.InsertCalendarDate(*day_tx, day).code == ErrorCode::AlreadyExists);
  day_tx->Rollback();

  auto missing_tx = repo.Begin();
  assert(repo.SoftDeleteSignoff(*missing_tx, 999).code == ErrorCode::NotFound);
  missing_tx->Rollback();
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertUser(*tx, UserRecord{77, "Temp", "temp@cisco.com", false}));
    tx->Rollback();
  }
  {
    // destructor rolls back an uncommitted transaction
    auto tx = repo.Begin();
    assert(repo.InsertUser(*tx, UserRecord{78, "Temp", "temp2@cisco.com", false}));
  }

  auto tx     = repo.Begin();
  auto tables = repo.LoadTables(*tx);
  tx->Commit();
  for (const auto& user : tables.users) {
    assert(user.user_id != 77 && user.user_id != 78);
  }
}

signoff::compliance::ReportTables Compute(Repository& repo) {
  auto tx     = repo.Begin();
  auto tables = repo.LoadTables(*tx);
  tx->Commit();
  auto snapshot = std::make_shared<const signoff::snapshot::Snapshot>(std::move(tables));
  return signoff::compliance::ComputeReports(std::move(snapshot), signoff::compliance::ComplianceSettings::Defaults(), kAsOf);
}

void VerifySoftDeleteChangesReports(Repository& repo) {
  const auto before = Compute(repo);
  assert(before.qualification.rows.size() == 2);

  auto tx = repo.Begin();
  assert(repo.SoftDeleteSignoff(*tx, 3));
  tx->Commit();

  // C2's only event is gone from the resolvers but still blocks the anti-join
  const auto after = Compute(repo);
  assert(after.qualification.rows.size() == 1);
  assert(after.risk.rows.size() == 1);
  assert(std::none_of(after.never_signed_off.rows.begin(), after.never_signed_off.rows.end(),
                      [](const auto& row) { return row.contract.booking_contract == "C2"; }));

  auto placeholder = std::find_if(after.history.rows.begin(), after.history.rows.end(),
                                  [](const auto& row) { return row.contract.booking_contract == "C2"; });
  assert(placeholder != after.history.rows.end());
  assert(!placeholder->has_signoff);
}

void VerifyRestartDurability(BackendFactory& backend, const signoff::compliance::ReportTables& expected) {
  if (!backend.supports_restart()) {
    std::cout << "  skipping restart durability for backend: " << backend.name << "\n";
    return;
  }

  std::shared_ptr<Repository> repo;
  backend.restart(repo);
  const auto reloaded = Compute(*repo);
  assert(reloaded.history.rows == expected.history.rows);
  assert(reloaded.risk.rows == expected.risk.rows);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SIGNOFF_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("signoff_reporter_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<signoff::db::sqlite::SqliteDB>(db_path);
    for (const auto* sql : signoff::db::sql::kSqliteSchema) {
      db->Exec(sql);
    }
    return std::make_shared<signoff::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if SIGNOFF_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SIGNOFF_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SIGNOFF_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto connect  = [conninfo](bool reset) {
    auto       pool = std::make_shared<signoff::db::postgres::PgPool>(conninfo);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    for (const auto* sql : signoff::db::sql::kPostgresSchema) {
      tx.exec(sql);
    }
    if (reset) {
      tx.exec("TRUNCATE booking_contract, signoff, responsible_user, dc_user, org_hierarchy, dimension, calendar_date;");
    }
    tx.commit();
    return std::make_shared<signoff::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = [connect]() { return connect(true); },
      .supports_restart = []() { return true; },
      .restart          = [connect](std::shared_ptr<Repository>& repo) { repo = connect(false); },
      .cleanup          = []() {},
  };
}
#endif

signoff::compliance::ReportTables RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyFixtureRoundTrip(*repo);
  VerifyUniqueKeys(*repo);
  VerifyRollbackDiscardsWrites(*repo);

  const auto reports = Compute(*repo);
  assert(reports.history.rows.size() == 4);
  assert(reports.qualification.rows.size() == 2);
  assert(reports.never_signed_off.rows.size() == 1);
  assert(reports.risk.rows.size() == 2);

  VerifyRestartDurability(backend, reports);
  VerifySoftDeleteChangesReports(*repo);
  VerifyNullableColumns(*repo);

  backend.cleanup();
  return reports;
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SIGNOFF_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SIGNOFF_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  std::vector<signoff::compliance::ReportTables> results;
  for (auto& backend : backends) {
    results.push_back(RunBackendSuite(backend));
  }

  // every backend yields identical reports for the same input
  for (const auto& result : results) {
    assert(result.history.rows == results.front().history.rows);
    assert(result.qualification.rows == results.front().qualification.rows);
    assert(result.never_signed_off.rows == results.front().never_signed_off.rows);
    assert(result.risk.rows == results.front().risk.rows);
  }

  std::cout << "signoff_reporter_integration_repository_parity: pass\n";
  return 0;
}
