#include "internal/seed/fixture_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "sample_fixture.hpp"

namespace {

using signoff::db::memory::MemoryRepository;
using signoff::seed::FixtureLoader;

signoff::db::model::SnapshotTables Load(MemoryRepository& repo) {
  auto tx     = repo.Begin();
  auto tables = repo.LoadTables(*tx);
  tx->Commit();
  return tables;
}

template <typename Error>
bool Rejects(const std::string& yaml) {
  MemoryRepository repo;
  try {
    (void)FixtureLoader::LoadString(repo, yaml);
  } catch (const Error&) {
    // nothing from a rejected fixture is visible
    const auto tables = Load(repo);
    assert(tables.contracts.empty() && tables.signoffs.empty() && tables.dimensions.empty() && tables.calendar.empty());
    return true;
  }
  return false;
}

void TestSampleFixtureLoads() {
  MemoryRepository repo;
  const auto       stats = FixtureLoader::LoadString(repo, signoff::testing::kSampleFixture);
  assert(stats.contracts == 3);
  assert(stats.signoffs == 3);
  assert(stats.responsible_users == 1);
  assert(stats.users == 1);
  assert(stats.org_hierarchy == 1);
  assert(stats.dimensions == 10);
  assert(stats.calendar_dates == 3);

  const auto tables = Load(repo);
  assert(tables.contracts[0].booking_contract == "C1");
  assert(tables.contracts[0].account_name == "Acme");
  assert(tables.contracts[0].sold_as_hw_allocation == 0.6);
  assert(tables.contracts[1].sold_as_sw_allocation == 0.0);
  assert(tables.signoffs[2].booking_contract == "C2");
  assert(tables.signoffs[2].notes == "only");
  assert(tables.signoffs[2].create_dtm == *signoff::util::ParseTimestamp("2024-06-01T09:00:00Z"));
  assert(!tables.signoffs[2].is_deleted);
  assert(tables.users[0].user_title == "Engineer");
  assert(*tables.org_hierarchy[0].emp_cco_id_masked == "M-10");
  assert(tables.calendar.size() == 3);
  assert(tables.calendar[1].date == *signoff::util::ParseDate("2024-05-20"));
  assert(tables.calendar[1].fiscal_mth_sorted_name == "FY2024 M10");
  assert(tables.calendar[2].cal_week_sorted_short_name == "2024 W22");
}

void TestOptionalValues() {
  MemoryRepository repo;
  FixtureLoader::LoadString(repo, R"(
contracts:
  - booking_contract: X1
    agreement_start_date: 2024-01-01
    is_deleted: true
org_hierarchy:
  - emp_cco_id: nomask
    emp_cco_id_masked: ~
)");

  const auto tables = Load(repo);
  assert(tables.contracts.size() == 1);
  assert(tables.contracts[0].agreement_start_date.has_value());
  assert(!tables.contracts[0].agreement_end_date.has_value());
  assert(tables.contracts[0].is_deleted);
  assert(!tables.org_hierarchy[0].emp_cco_id_masked.has_value());
}

void TestEmptyFixtureLoadsNothing() {
  MemoryRepository repo;
  const auto       stats = FixtureLoader::LoadString(repo, "");
  assert(stats.contracts == 0 && stats.dimensions == 0);
}

void TestMalformedFixturesAreRejected() {
  assert(Rejects<signoff::util::InvalidArgument>("- just\n- a list\n"));
  assert(Rejects<signoff::util::InvalidArgument>("contracts: {booking_contract: C1}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("contracts:\n  - agreement_start_date: 2024-01-01\n"));
  assert(Rejects<signoff::util::InvalidArgument>("contracts:\n  - {booking_contract: C1, agreement_end_date: 31/12/2024}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("signoffs:\n  - {signoff_id: 1, booking_contract: C1, create_dtm: yesterday}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("dimensions:\n  colour: {1: Red}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("dimensions:\n  theater: {abc: Americas}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("contracts:\n  - {booking_contract: C1}\nusers:\n  - {user_id: many}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("calendar:\n  - {fiscal_qtr_sorted_name: FY2024 Q1}\n"));
  assert(Rejects<signoff::util::InvalidArgument>("calendar:\n  - {date: 2024-13-01}\n"));
  assert(Rejects<std::runtime_error>("calendar:\n  - {date: 2024-01-01}\n  - {date: 2024-01-01}\n"));

  // the repository rejects the second row; the first is rolled back with it
  assert(Rejects<std::runtime_error>(R"(
contracts:
  - {booking_contract: C1}
signoffs:
  - {signoff_id: 1, booking_contract: C1, create_dtm: "2024-01-01T00:00:00Z"}
  - {signoff_id: 1, booking_contract: C1, create_dtm: "2024-01-02T00:00:00Z"}
)"));
}

void TestLoadFile() {
  const auto dir = std::filesystem::temp_directory_path() / "signoff_reporter_fixture_loader_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "sample.yaml";
  {
    std::ofstream out(path);
    out << signoff::testing::kSampleFixture;
  }

  MemoryRepository repo;
  assert(FixtureLoader::LoadFile(repo, path.string()).contracts == 3);

  bool threw = false;
  try {
    (void)FixtureLoader::LoadFile(repo, (dir / "missing.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSampleFixtureLoads();
  TestOptionalValues();
  TestEmptyFixtureLoadsNothing();
  TestMalformedFixturesAreRejected();
  TestLoadFile();

  std::cout << "signoff_reporter_unit_fixture_loader: pass\n";
  return 0;
}
