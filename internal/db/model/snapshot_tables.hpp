#pragma once

#include <vector>

#include "internal/db/model/calendar_record.hpp"
#include "internal/db/model/contract_record.hpp"
#include "internal/db/model/dimension_record.hpp"
#include "internal/db/model/signoff_record.hpp"
#include "internal/db/model/user_record.hpp"

namespace signoff::db::model {

// Raw contents of every input table, in storage order.
struct SnapshotTables {
  std::vector<BookingContractRecord> contracts;
  std::vector<SignoffRecord>         signoffs;
  std::vector<ResponsibleUserRecord> responsible_users;
  std::vector<UserRecord>            users;
  std::vector<OrgHierarchyRecord>    org_hierarchy;
  std::vector<DimensionRecord>       dimensions;
  std::vector<CalendarDateRecord>    calendar;
};

} // namespace signoff::db::model
