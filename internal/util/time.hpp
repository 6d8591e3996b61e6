#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace signoff::util {

/*
  Time utilities. Single place to control the clock source.

  All calendar arithmetic is done on UTC civil dates. Only the run
  coordinator calls Now(); everything downstream receives an explicit
  as-of value.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::sys_days;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// UTC calendar date containing tp.
Date ToDate(TimePoint tp);

Date AddDays(Date date, int days);

// Calendar month arithmetic; clamps to the last day of the target month
// (2024-01-31 + 1 month = 2024-02-29).
Date AddMonths(Date date, int months);

// Number of UTC date boundaries crossed going from `from` to `to`.
// Negative when `from` is on a later date than `to`.
int64_t DaysBetween(TimePoint from, TimePoint to);

// Strict "YYYY-MM-DD".
std::optional<Date> ParseDate(std::string_view text);
std::string         FormatDate(Date date);

// "YYYY-MM-DD" (midnight UTC) or "YYYY-MM-DD[T ]HH:MM:SS[Z]".
std::optional<TimePoint> ParseTimestamp(std::string_view text);
std::string              FormatTimestamp(TimePoint tp);

} // namespace signoff::util
