#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace signoff::db::model {

// Date dimension row: display names of the fiscal quarter, fiscal month
// and calendar week containing one UTC calendar date.
struct CalendarDateRecord {
  util::Date  date{};
  std::string fiscal_qtr_sorted_name;
  std::string fiscal_mth_sorted_name;
  std::string cal_week_sorted_short_name;
};

} // namespace signoff::db::model
