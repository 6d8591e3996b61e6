#include "internal/service/report_service.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "compliance_fixtures.hpp"
#include "internal/compliance/compliance_settings.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/report/report_store.hpp"
#include "internal/report/run_coordinator.hpp"
#include "internal/seed/fixture_loader.hpp"
#include "internal/util/errors.hpp"
#include "sample_fixture.hpp"

namespace {

using namespace signoff::report::v1;
using signoff::testing::At;

// Delegates to a memory repository and fails LoadTables on demand.
class FlakyRepository final : public signoff::db::Repository {
 public:
  bool fail_loads = false;

  std::unique_ptr<signoff::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  signoff::db::Result InsertContract(signoff::db::Transaction& tx, const signoff::db::model::BookingContractRecord& r) override {
    return inner_.InsertContract(tx, r);
  }
  signoff::db::Result InsertResponsibleUser(signoff::db::Transaction& tx, const signoff::db::model::ResponsibleUserRecord& r) override {
    return inner_.InsertResponsibleUser(tx, r);
  }
  signoff::db::Result InsertSignoff(signoff::db::Transaction& tx, const signoff::db::model::SignoffRecord& r) override {
    return inner_.InsertSignoff(tx, r);
  }
  signoff::db::Result SoftDeleteSignoff(signoff::db::Transaction& tx, std::int64_t signoff_id) override {
    return inner_.SoftDeleteSignoff(tx, signoff_id);
  }
  signoff::db::Result InsertUser(signoff::db::Transaction& tx, const signoff::db::model::UserRecord& r) override {
    return inner_.InsertUser(tx, r);
  }
  signoff::db::Result InsertOrgHierarchy(signoff::db::Transaction& tx, const signoff::db::model::OrgHierarchyRecord& r) override {
    return inner_.InsertOrgHierarchy(tx, r);
  }
  signoff::db::Result InsertDimension(signoff::db::Transaction& tx, const signoff::db::model::DimensionRecord& r) override {
    return inner_.InsertDimension(tx, r);
  }
  signoff::db::Result InsertCalendarDate(signoff::db::Transaction& tx, const signoff::db::model::CalendarDateRecord& r) override {
    return inner_.InsertCalendarDate(tx, r);
  }
  signoff::db::model::SnapshotTables LoadTables(signoff::db::Transaction& tx) override {
    if (fail_loads) throw std::runtime_error("database unavailable");
    return inner_.LoadTables(tx);
  }

 private:
  signoff::db::memory::MemoryRepository inner_;
};

struct Harness {
  std::shared_ptr<FlakyRepository>                 repository = std::make_shared<FlakyRepository>();
  std::shared_ptr<signoff::reports::ReportStore>    store      = std::make_shared<signoff::reports::ReportStore>(5);
  std::shared_ptr<signoff::reports::RunCoordinator> coordinator;
  std::unique_ptr<signoff::service::ReportService>  service;

  Harness() {
    signoff::seed::FixtureLoader::LoadString(*repository, signoff::testing::kSampleFixture);
    coordinator = std::make_shared<signoff::reports::RunCoordinator>(repository, store, signoff::compliance::ComplianceSettings::Defaults());

    signoff::service::ServiceContext ctx;
    ctx.coordinator       = coordinator;
    ctx.store             = store;
    ctx.default_page_size = 3;
    ctx.max_page_size     = 10;
    service               = std::make_unique<signoff::service::ReportService>(ctx);
  }

  RunSummary RunAt(const std::string& as_of) {
    RunReportsRequest req;
    *req.mutable_as_of() = signoff::util::ToProto(At(as_of));
    return service->RunReports(req).run();
  }
};

template <typename Error, typename Fn>
bool ThrowsAs(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

const PipelineSummary& FindPipeline(const RunSummary& summary, const std::string& name) {
  for (const auto& pipeline : summary.pipelines()) {
    if (pipeline.pipeline() == name) return pipeline;
  }
  throw std::runtime_error("pipeline missing from summary: " + name);
}

void TestQueriesBeforeFirstRun() {
  Harness h;

  assert(ThrowsAs<signoff::util::InvalidState>([&] { (void)h.service->ListHistory(RowQuery{}); }));

  RowQuery bad;
  bad.set_date_from("06/01/2024");
  assert(ThrowsAs<signoff::util::InvalidArgument>([&] { (void)h.service->ListRisk(bad); }));

  const auto health = h.service->Health(HealthRequest{});
  assert(health.serving());
  assert(health.latest_run_id().empty());
  assert(health.retained_runs() == 0);
}

void TestRunProducesSummary() {
  Harness    h;
  const auto run = h.RunAt("2024-06-15T00:00:00Z");

  assert(run.status() == RUN_STATUS_COMPLETED);
  assert(!run.run_id().empty());
  assert(run.as_of().seconds() == signoff::util::ToProto(At("2024-06-15T00:00:00Z")).seconds());
  assert(run.pipelines_size() == 4);
  assert(FindPipeline(run, "history").rows() == 4);
  assert(FindPipeline(run, "history").eligible_contracts() == 3);
  assert(FindPipeline(run, "qualification").rows() == 2);
  assert(FindPipeline(run, "never_signed_off").rows() == 1);
  assert(FindPipeline(run, "risk").rows() == 2);
  assert(FindPipeline(run, "history").dropped().empty());
  assert(run.ambiguous_hierarchy_matches() == 0);

  GetRunRequest get;
  get.set_run_id(run.run_id());
  assert(h.service->GetRun(get).run().status() == RUN_STATUS_COMPLETED);

  const auto health = h.service->Health(HealthRequest{});
  assert(health.latest_run_id() == run.run_id());
  assert(health.retained_runs() == 1);
}

void TestHistoryPagination() {
  Harness h;
  const auto run = h.RunAt("2024-06-15T00:00:00Z");

  RowQuery   query;
  const auto first = h.service->ListHistory(query);
  assert(first.rows_size() == 3);
  assert(first.page().run_id() == run.run_id());
  assert(first.page().total_size() == 4);
  assert(first.page().next_page_token() == "3");
  assert(first.rows(0).contract().booking_contract() == "C1");
  assert(first.rows(0).notes() == "first");
  assert(!first.rows(0).is_last_signoff());
  assert(first.rows(1).is_last_signoff());
  assert(first.rows(1).org().level6_worker_name() == "VP Alice");
  assert(first.rows(1).contract().account_name() == "Acme");
  assert(first.rows(1).create_dtm().seconds() == first.rows(1).signoff_create_dtm().seconds());

  query.set_page_token(first.page().next_page_token());
  const auto second = h.service->ListHistory(query);
  assert(second.rows_size() == 1);
  assert(second.page().next_page_token().empty());

  const auto& placeholder = second.rows(0);
  assert(placeholder.contract().booking_contract() == "C3");
  assert(!placeholder.has_signoff());
  assert(!placeholder.has_create_dtm());
  assert(placeholder.org().mgr_name() == "Not Assigned");

  RowQuery big;
  big.set_page_size(1000);
  assert(h.service->ListHistory(big).rows_size() == 4);

  RowQuery bad_token;
  bad_token.set_page_token("next");
  assert(ThrowsAs<signoff::util::InvalidArgument>([&] { (void)h.service->ListHistory(bad_token); }));
}

void TestRowFilters() {
  Harness h;
  h.RunAt("2024-06-15T00:00:00Z");

  RowQuery by_contract;
  by_contract.set_booking_contract("C1");
  assert(h.service->ListHistory(by_contract).page().total_size() == 2);
  assert(h.service->ListRisk(by_contract).rows(0).org().level6_worker_name() == "VP Alice");

  RowQuery in_may;
  in_may.set_date_from("2024-05-01");
  in_may.set_date_to("2024-05-31");
  const auto qualification = h.service->ListQualification(in_may);
  assert(qualification.rows_size() == 1);
  assert(qualification.rows(0).booking_contract() == "C1");
  assert(qualification.rows(0).qualified_ibv() == "Signed off");
  assert(qualification.rows(0).days_since_last_signoff_event() == 26);

  // never-signed-off rows have no date
  assert(h.service->ListNeverSignedOff(in_may).rows_size() == 0);
  assert(h.service->ListNeverSignedOff(RowQuery{}).rows(0).contract().booking_contract() == "C3");

  const auto risk = h.service->ListRisk(RowQuery{});
  assert(risk.rows_size() == 2);
  assert(risk.rows(0).signoff_risk() == "a_low_risk");
  assert(risk.rows(1).contract().booking_contract() == "C2");
  assert(risk.rows(1).org().theater() == "Not Assigned");

  RowQuery inverted;
  inverted.set_date_from("2024-06-01");
  inverted.set_date_to("2024-05-01");
  assert(ThrowsAs<signoff::util::InvalidArgument>([&] { (void)h.service->ListQualification(inverted); }));
}

void TestRunLookupErrors() {
  Harness h;
  h.RunAt("2024-06-15T00:00:00Z");

  GetRunRequest empty;
  assert(ThrowsAs<signoff::util::InvalidArgument>([&] { (void)h.service->GetRun(empty); }));

  GetRunRequest unknown;
  unknown.set_run_id("no-such-run");
  assert(ThrowsAs<signoff::util::NotFound>([&] { (void)h.service->GetRun(unknown); }));

  RowQuery unknown_rows;
  unknown_rows.set_run_id("no-such-run");
  assert(ThrowsAs<signoff::util::NotFound>([&] { (void)h.service->ListHistory(unknown_rows); }));

  RunReportsRequest bad_nanos;
  bad_nanos.mutable_as_of()->set_seconds(1718409600);
  bad_nanos.mutable_as_of()->set_nanos(-5);
  assert(ThrowsAs<signoff::util::InvalidArgument>([&] { (void)h.service->RunReports(bad_nanos); }));
}

void TestFailedRunKeepsPreviousReports() {
  Harness    h;
  const auto good = h.RunAt("2024-06-15T00:00:00Z");

  h.repository->fail_loads = true;
  std::string failed_run_id;
  try {
    (void)h.RunAt("2024-06-16T00:00:00Z");
  } catch (const signoff::util::RunFailed& e) {
    failed_run_id = e.run_id();
  }
  assert(!failed_run_id.empty());

  const auto runs = h.service->ListRuns(ListRunsRequest{});
  assert(runs.runs_size() == 2);
  assert(runs.runs(0).run_id() == failed_run_id);
  assert(runs.runs(0).status() == RUN_STATUS_FAILED);
  assert(runs.runs(0).error_message() == "database unavailable");
  assert(runs.runs(1).run_id() == good.run_id());

  const auto history = h.service->ListHistory(RowQuery{});
  assert(history.page().run_id() == good.run_id());

  RowQuery failed;
  failed.set_run_id(runs.runs(0).run_id());
  assert(ThrowsAs<signoff::util::InvalidState>([&] { (void)h.service->ListHistory(failed); }));

  h.repository->fail_loads = false;
  const auto later = h.RunAt("2024-06-16T00:00:00Z");
  assert(h.service->ListHistory(RowQuery{}).page().run_id() == later.run_id());

  RowQuery pinned;
  pinned.set_run_id(good.run_id());
  assert(h.service->ListHistory(pinned).page().run_id() == good.run_id());
}

} // namespace

int main() {
  TestQueriesBeforeFirstRun();
  TestRunProducesSummary();
  TestHistoryPagination();
  TestRowFilters();
  TestRunLookupErrors();
  TestFailedRunKeepsPreviousReports();

  std::cout << "signoff_reporter_unit_report_service: pass\n";
  return 0;
}
