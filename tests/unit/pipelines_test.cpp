#include "internal/compliance/pipelines.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "compliance_fixtures.hpp"
#include "internal/compliance/classification.hpp"
#include "internal/compliance/never_signed_off.hpp"
#include "internal/compliance/report_engine.hpp"
#include "internal/snapshot/snapshot.hpp"

namespace {

using signoff::compliance::ComplianceSettings;
using signoff::compliance::OrgAttribution;
using signoff::compliance::OrgAttributionResolver;
using signoff::compliance::PipelineContext;
using signoff::snapshot::Snapshot;
using namespace signoff::testing;

const auto kAsOf = At("2024-06-15T12:00:00Z");

/*
  A  two live events (portal by alice, deferred by bob) plus one deleted
  B  no events, no responsible users
  C  only a deleted event
  D  one event whose method has no dimension row
  E  no events, unknown service type
  F  two identical events at the same instant by different users
  G  deleted contract with an event
*/
std::shared_ptr<const Snapshot> BuildSnapshot() {
  auto tables = StandardTables();
  for (const auto* id : {"A", "B", "C", "D", "E", "F"}) {
    tables.contracts.push_back(Contract(id, "2024-01-01", "2024-12-31"));
  }
  tables.contracts[4].sold_as_service_type_id = 99;

  auto deleted_contract       = Contract("G", "2024-01-01", "2024-12-31");
  deleted_contract.is_deleted = true;
  tables.contracts.push_back(deleted_contract);

  tables.signoffs.push_back(Event(1, "A", 10, "2024-03-01T09:00:00Z"));
  tables.signoffs.push_back(Event(2, "A", 11, "2024-05-01T09:00:00Z", kDeferredMethod));
  auto deleted       = Event(3, "A", 10, "2024-06-01T09:00:00Z");
  deleted.is_deleted = true;
  tables.signoffs.push_back(deleted);

  auto only_deleted       = Event(4, "C", 10, "2024-04-01T09:00:00Z");
  only_deleted.is_deleted = true;
  tables.signoffs.push_back(only_deleted);

  tables.signoffs.push_back(Event(5, "D", 10, "2024-05-01T09:00:00Z", 5));

  auto f1  = Event(6, "F", 10, "2024-06-01T09:00:00Z");
  auto f2  = Event(7, "F", 11, "2024-06-01T09:00:00Z");
  f1.notes = "same";
  f2.notes = "same";
  tables.signoffs.push_back(f1);
  tables.signoffs.push_back(f2);

  tables.signoffs.push_back(Event(8, "G", 10, "2024-05-01T09:00:00Z"));

  tables.responsible_users.push_back({"A", 10, false});
  tables.responsible_users.push_back({"A", 11, false});
  tables.responsible_users.push_back({"A", 12, true});

  tables.users.push_back(User(10, "alice@cisco.com"));
  tables.users.push_back(User(11, "bob@cisco.com", true));
  tables.org_hierarchy.push_back(OrgEntry("alice", std::string("M-10"), "VP Alice"));
  tables.org_hierarchy.push_back(OrgEntry("bob", std::string("M-11"), "VP Bob"));

  return std::make_shared<const Snapshot>(std::move(tables));
}

struct Fixture {
  std::shared_ptr<const Snapshot> snapshot = BuildSnapshot();
  ComplianceSettings              settings = ComplianceSettings::Defaults();
  OrgAttributionResolver          attribution{*snapshot, settings.org_domain};
  PipelineContext                 ctx{*snapshot, settings, attribution, kAsOf};
};

void TestHistoryEmitsEventsAndPlaceholders() {
  Fixture    f;
  const auto result = signoff::compliance::RunHistoryPipeline(f.ctx);

  assert(result.eligible_contracts == 6);
  assert(result.rows.size() == 7);

  const auto& a1 = result.rows[0];
  assert(a1.contract.booking_contract == "A");
  assert(a1.has_signoff && a1.signoff_id == 1);
  assert(a1.is_last_signoff);
  assert(a1.signoff_days_ago == 106);
  assert(a1.signoff_method == "signoff_method one");
  assert(a1.org.level6_worker_name == "VP Alice");
  assert(a1.fiscal_qtr_sorted_name == "2024 Q1");
  assert(a1.fiscal_mth_sorted_name == "2024 M03");
  assert(a1.cal_week_sorted_short_name == "2024 W09");

  // deleted users still join; their attribution is the sentinel
  const auto& a2 = result.rows[1];
  assert(a2.signoff_id == 2 && a2.signoff_method == "Deferred");
  assert(!a2.is_last_signoff);
  assert(a2.user_title == "Title 11");
  assert(a2.org == OrgAttribution::Sentinel());

  for (const auto* placeholder_contract : {"B", "C", "D"}) {
    auto it = std::find_if(result.rows.begin(), result.rows.end(),
                           [&](const auto& row) { return row.contract.booking_contract == placeholder_contract; });
    assert(it != result.rows.end());
    assert(!it->has_signoff);
    assert(!it->create_dtm.has_value());
    assert(!it->is_last_signoff);
    assert(it->org == OrgAttribution::Sentinel());
  }

  const auto& f_first  = result.rows[5];
  const auto& f_second = result.rows[6];
  assert(f_first.contract.booking_contract == "F" && f_first.dc_user_id == 10 && !f_first.is_last_signoff);
  assert(f_second.contract.booking_contract == "F" && f_second.dc_user_id == 11 && f_second.is_last_signoff);

  assert(result.drops.Get("missing_signoff_method") == 1);
  assert(result.drops.Get("missing_service_type") == 1);
  assert(std::none_of(result.rows.begin(), result.rows.end(), [](const auto& row) { return row.contract.booking_contract == "E"; }));
  assert(std::none_of(result.rows.begin(), result.rows.end(), [](const auto& row) { return row.contract.booking_contract == "G"; }));
}

void TestQualificationKeepsDistinctLatestRows() {
  Fixture    f;
  const auto result = signoff::compliance::RunQualificationPipeline(f.ctx);

  assert(result.eligible_contracts == 6);
  assert(result.rows.size() == 2);

  const auto& a = result.rows[0];
  assert(a.booking_contract == "A");
  assert(a.ibv_method == "Deferred");
  assert(a.qualified_ibv == signoff::compliance::kDeferredSignedOff);
  assert(a.days_since_last_signoff_event == 45);
  assert(a.last_signoff_date == At("2024-05-01T09:00:00Z"));

  const auto& fr = result.rows[1];
  assert(fr.booking_contract == "F");
  assert(fr.qualified_ibv == signoff::compliance::kSignedOff);
  assert(fr.days_since_last_signoff_event == 14);
  assert(fr.notes == "same");

  assert(result.drops.Get("missing_signoff_method") == 1);
}

void TestQualificationOverdueAfterThreshold() {
  Fixture f;
  auto    late = f.ctx;
  late.as_of   = At("2024-07-31T00:00:00Z");
  const auto result = signoff::compliance::RunQualificationPipeline(late);

  auto it = std::find_if(result.rows.begin(), result.rows.end(), [](const auto& row) { return row.booking_contract == "A"; });
  assert(it != result.rows.end());
  assert(it->days_since_last_signoff_event == 91);
  assert(it->qualified_ibv == signoff::compliance::kSignOffOverdue);
}

void TestNeverSignedOffTreatsDeletedEventsAsPresence() {
  Fixture f;

  std::vector<const signoff::db::model::BookingContractRecord*> universe;
  for (const auto& contract : f.snapshot->Contracts()) {
    if (!contract.is_deleted) universe.push_back(&contract);
  }
  const auto never = signoff::compliance::FindNeverSignedOff(*f.snapshot, universe);
  assert(never.size() == 2);
  assert(never[0]->booking_contract == "B");
  assert(never[1]->booking_contract == "E");

  const auto result = signoff::compliance::RunNeverSignedOffPipeline(f.ctx);
  assert(result.rows.size() == 1);
  assert(result.rows[0].contract.booking_contract == "B");
  assert(result.rows[0].org == OrgAttribution::Sentinel());
  assert(result.drops.Get("missing_service_type") == 1);
}

void TestRiskEmitsOneRowPerResponsibleUser() {
  Fixture    f;
  const auto result = signoff::compliance::RunRiskPipeline(f.ctx);

  assert(result.eligible_contracts == 6);
  assert(result.rows.size() == 4);

  assert(result.rows[0].contract.booking_contract == "A");
  assert(result.rows[1].contract.booking_contract == "A");
  assert(result.rows[0].org.level6_worker_name == "VP Alice");
  assert(result.rows[1].org == OrgAttribution::Sentinel());
  // the deferred and the deleted event are both ignored
  assert(result.rows[0].last_signoff_date == At("2024-03-01T09:00:00Z"));
  assert(result.rows[0].signoff_days_ago == 106);
  assert(result.rows[0].signoff_risk == signoff::compliance::kHighRisk);

  assert(result.rows[2].contract.booking_contract == "D");
  assert(result.rows[2].signoff_risk == signoff::compliance::kLowRisk);
  assert(result.rows[3].contract.booking_contract == "F");
  assert(result.rows[3].signoff_days_ago == 14);
  assert(result.rows[3].org == OrgAttribution::Sentinel());
}

void TestRiskWindowExcludesYoungContracts() {
  Fixture f;
  auto    early = f.ctx;
  early.as_of   = At("2024-03-31T23:00:00Z");
  const auto result = signoff::compliance::RunRiskPipeline(early);
  assert(result.eligible_contracts == 0);
  assert(result.rows.empty());
}

void TestNeverSignedOffDisjointFromSignedHistory() {
  Fixture    f;
  const auto history = signoff::compliance::RunHistoryPipeline(f.ctx);
  const auto never   = signoff::compliance::RunNeverSignedOffPipeline(f.ctx);

  std::set<std::string> signed_contracts;
  for (const auto& row : history.rows) {
    if (row.has_signoff) signed_contracts.insert(row.contract.booking_contract);
  }
  for (const auto& row : never.rows) {
    assert(!signed_contracts.contains(row.contract.booking_contract));
  }
}

void TestHistoryDropsEventsWithoutCalendarDay() {
  auto tables = StandardTables();
  std::erase_if(tables.calendar, [](const auto& day) { return day.date == Day("2024-05-01"); });
  tables.contracts.push_back(Contract("A", "2024-01-01", "2024-12-31"));
  tables.contracts.push_back(Contract("K", "2024-01-01", "2024-12-31"));
  tables.signoffs.push_back(Event(1, "A", 10, "2024-03-01T09:00:00Z"));
  tables.signoffs.push_back(Event(2, "A", 10, "2024-05-01T09:00:00Z"));
  tables.signoffs.push_back(Event(3, "K", 10, "2024-05-01T23:59:59Z"));
  tables.users.push_back(User(10, "alice@cisco.com"));

  const Snapshot               snapshot(std::move(tables));
  const auto                   settings = ComplianceSettings::Defaults();
  const OrgAttributionResolver attribution(snapshot, settings.org_domain);
  const PipelineContext        ctx{snapshot, settings, attribution, kAsOf};
  const auto                   result = signoff::compliance::RunHistoryPipeline(ctx);

  assert(result.drops.Get("missing_date") == 2);
  assert(result.rows.size() == 2);
  assert(result.rows[0].contract.booking_contract == "A");
  assert(result.rows[0].signoff_id == 1);
  assert(result.rows[0].fiscal_mth_sorted_name == "2024 M03");
  // every event of K missed the calendar, leaving only its placeholder
  assert(result.rows[1].contract.booking_contract == "K");
  assert(!result.rows[1].has_signoff);
}

/*
  L  live event, inside every window
  S  only soft-deleted events
  V  live event, ended 2024-05-15: history window only
  W  no events, ended 2024-05-15: history window only
  N  no events, inside every window
*/
void TestQualificationAndNeverSignedOffAreDisjoint() {
  auto tables = StandardTables();
  for (const auto* id : {"L", "S", "N"}) {
    tables.contracts.push_back(Contract(id, "2024-01-01", "2024-12-31"));
  }
  tables.contracts.push_back(Contract("V", "2024-01-01", "2024-05-15"));
  tables.contracts.push_back(Contract("W", "2024-01-01", "2024-05-15"));

  tables.signoffs.push_back(Event(1, "L", 10, "2024-06-01T09:00:00Z"));
  for (std::int64_t id : {2, 3}) {
    auto deleted       = Event(id, "S", 10, "2024-05-0" + std::to_string(id) + "T09:00:00Z");
    deleted.is_deleted = true;
    tables.signoffs.push_back(deleted);
  }
  tables.signoffs.push_back(Event(4, "V", 10, "2024-05-10T09:00:00Z"));

  const Snapshot               snapshot(std::move(tables));
  const auto                   settings = ComplianceSettings::Defaults();
  const OrgAttributionResolver attribution(snapshot, settings.org_domain);
  const PipelineContext        ctx{snapshot, settings, attribution, kAsOf};

  const auto qualification = signoff::compliance::RunQualificationPipeline(ctx);
  const auto never         = signoff::compliance::RunNeverSignedOffPipeline(ctx);

  std::set<std::string> qualified;
  for (const auto& row : qualification.rows) qualified.insert(row.booking_contract);
  std::set<std::string> never_signed;
  for (const auto& row : never.rows) never_signed.insert(row.contract.booking_contract);

  assert(qualified == std::set<std::string>({"L"}));
  assert(never_signed == std::set<std::string>({"N", "W"}));
  for (const auto& id : never_signed) {
    assert(!qualified.contains(id));
  }
}

void TestComputeReportsIsDeterministic() {
  const auto snapshot = BuildSnapshot();
  const auto settings = ComplianceSettings::Defaults();

  const auto first  = signoff::compliance::ComputeReports(snapshot, settings, kAsOf);
  const auto second = signoff::compliance::ComputeReports(snapshot, settings, kAsOf);

  assert(first.history.rows == second.history.rows);
  assert(first.qualification.rows == second.qualification.rows);
  assert(first.never_signed_off.rows == second.never_signed_off.rows);
  assert(first.risk.rows == second.risk.rows);
  assert(first.history.drops.All() == second.history.drops.All());
  assert(first.ambiguous_hierarchy_matches == 0);

  assert(first.history.rows.size() == 7);
  assert(first.qualification.rows.size() == 2);
  assert(first.never_signed_off.rows.size() == 1);
  assert(first.risk.rows.size() == 4);
}

} // namespace

int main() {
  TestHistoryEmitsEventsAndPlaceholders();
  TestQualificationKeepsDistinctLatestRows();
  TestQualificationOverdueAfterThreshold();
  TestNeverSignedOffTreatsDeletedEventsAsPresence();
  TestRiskEmitsOneRowPerResponsibleUser();
  TestRiskWindowExcludesYoungContracts();
  TestNeverSignedOffDisjointFromSignedHistory();
  TestHistoryDropsEventsWithoutCalendarDay();
  TestQualificationAndNeverSignedOffAreDisjoint();
  TestComputeReportsIsDeterministic();

  std::cout << "signoff_reporter_unit_pipelines: pass\n";
  return 0;
}
