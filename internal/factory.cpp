#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/compliance/compliance_settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/export/report_exporter.hpp"
#include "internal/grpc/report_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_scheduler.hpp"
#include "internal/report/report_store.hpp"
#include "internal/report/run_coordinator.hpp"
#include "internal/seed/fixture_loader.hpp"
#include "internal/service/report_service.hpp"
#include "internal/service/service_context.hpp"
#if SIGNOFF_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SIGNOFF_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if SIGNOFF_WITH_ARROW
#include "internal/export/arrow_report_exporter.hpp"
#endif

namespace signoff::factory {

using signoff::observability::IntField;
using signoff::observability::StringField;

namespace {

constexpr std::uint32_t kDefaultRetainedRuns = 10;
constexpr std::uint32_t kDefaultPageSize     = 100;
constexpr std::uint32_t kDefaultMaxPageSize  = 1000;

#if SIGNOFF_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT booking_contract,agreement_start_date,agreement_end_date,is_deleted FROM booking_contract LIMIT 1;");
  sqlite_db->Exec("SELECT signoff_id,booking_contract,create_dtm_ms,is_deleted FROM signoff LIMIT 1;");
  sqlite_db->Exec("SELECT kind,id,name FROM dimension LIMIT 1;");
}
#endif

#if SIGNOFF_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT booking_contract,agreement_start_date,agreement_end_date,is_deleted FROM booking_contract LIMIT 1;");
  tx.exec("SELECT signoff_id,booking_contract,create_dtm_ms,is_deleted FROM signoff LIMIT 1;");
  tx.exec("SELECT kind,id,name FROM dimension LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<exporter::ReportExporter> BuildExporter(const signoff::runtime::config::ReportsConfig& reports) {
  const auto& directory = reports.export_().directory();
  if (directory.empty()) {
    return nullptr;
  }
#if SIGNOFF_WITH_ARROW
  return std::make_shared<exporter::ArrowReportExporter>(directory);
#else
  throw std::runtime_error("reports.export.directory is set but Arrow export was not enabled at build time");
#endif
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const signoff::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  std::shared_ptr<db::Repository> repository;

  if (database.has_sqlite()) {
#if SIGNOFF_DB_SQLITE
    const bool wal_mode  = database.sqlite().has_wal_mode() ? database.sqlite().wal_mode() : true;
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), wal_mode);
    BootstrapSqliteSchema(sqlite_db);
    repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else if (database.has_postgres()) {
#if SIGNOFF_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  } else {
    repository = std::make_shared<db::memory::MemoryRepository>();
  }

  if (!database.seed_file().empty()) {
    const auto stats = seed::FixtureLoader::LoadFile(*repository, database.seed_file());
    SIGNOFF_LOG_INFO("Seeded input tables", {StringField("file", database.seed_file()), IntField("contracts", static_cast<std::int64_t>(stats.contracts)),
                                             IntField("signoffs", static_cast<std::int64_t>(stats.signoffs)),
                                             IntField("calendar_dates", static_cast<std::int64_t>(stats.calendar_dates))});
  }

  return repository;
}

/*
    Build full application dependency graph
*/
Application Build(const signoff::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto& reports = config.reports();

  // ------------------------------------------------------------------
  // Storage and report state
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<reports::ReportStore>(reports.has_retained_runs() ? reports.retained_runs() : kDefaultRetainedRuns);

  // ------------------------------------------------------------------
  // Run coordination
  // ------------------------------------------------------------------
  auto settings   = compliance::ComplianceSettings::FromConfig(config.compliance());
  app.coordinator = std::make_shared<reports::RunCoordinator>(app.repository, app.store, std::move(settings), BuildExporter(reports));

  if (reports.refresh_interval_sec() > 0) {
    app.scheduler = std::make_shared<reports::ReportScheduler>(app.coordinator, std::chrono::seconds(reports.refresh_interval_sec()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator       = app.coordinator;
  ctx.store             = app.store;
  ctx.max_page_size     = reports.has_max_page_size() ? reports.max_page_size() : kDefaultMaxPageSize;
  ctx.default_page_size = std::min<std::size_t>(reports.has_default_page_size() ? reports.default_page_size() : kDefaultPageSize, ctx.max_page_size);

  app.report_service = std::make_shared<service::ReportService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ReportServer>(app.report_service));

  return app;
}

} // namespace signoff::factory
