#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>

namespace {

using signoff::util::AddDays;
using signoff::util::AddMonths;
using signoff::util::DaysBetween;
using signoff::util::FormatDate;
using signoff::util::FormatTimestamp;
using signoff::util::ParseDate;
using signoff::util::ParseTimestamp;

void TestAddMonthsClampsToMonthEnd() {
  assert(FormatDate(AddMonths(*ParseDate("2024-01-31"), 1)) == "2024-02-29");
  assert(FormatDate(AddMonths(*ParseDate("2023-01-31"), 1)) == "2023-02-28");
  assert(FormatDate(AddMonths(*ParseDate("2024-06-30"), 1)) == "2024-07-30");
  assert(FormatDate(AddMonths(*ParseDate("2024-11-30"), 3)) == "2025-02-28");
  assert(FormatDate(AddMonths(*ParseDate("2024-03-31"), -1)) == "2024-02-29");
}

void TestAddDaysCrossesMonths() {
  assert(FormatDate(AddDays(*ParseDate("2024-06-30"), 30)) == "2024-07-30");
  assert(FormatDate(AddDays(*ParseDate("2024-12-31"), 1)) == "2025-01-01");
}

void TestDaysBetweenCountsDateBoundaries() {
  assert(DaysBetween(*ParseTimestamp("2024-06-01T23:59:00Z"), *ParseTimestamp("2024-06-02T00:01:00Z")) == 1);
  assert(DaysBetween(*ParseTimestamp("2024-06-02T00:01:00Z"), *ParseTimestamp("2024-06-02T23:59:00Z")) == 0);
  assert(DaysBetween(*ParseTimestamp("2024-06-10T00:00:00Z"), *ParseTimestamp("2024-06-01T00:00:00Z")) == -9);
}

void TestParseRejectsMalformedInput() {
  assert(!ParseDate("2024-02-30").has_value());
  assert(!ParseDate("2024-1-01").has_value());
  assert(!ParseDate("").has_value());
  assert(!ParseTimestamp("2024-06-01T25:00:00Z").has_value());
  assert(!ParseTimestamp("2024-06-01X10:00:00").has_value());
}

void TestFormatTimestampIsUtcIso() {
  const auto tp = *ParseTimestamp("2024-06-01 08:05:09");
  assert(FormatTimestamp(tp) == "2024-06-01T08:05:09Z");
  assert(FormatTimestamp(*ParseTimestamp("2024-06-01")) == "2024-06-01T00:00:00Z");
}

void TestProtoAndMillisConversions() {
  const auto tp = *ParseTimestamp("2024-06-01T08:05:09Z");
  assert(signoff::util::FromProto(signoff::util::ToProto(tp)) == tp);
  assert(signoff::util::FromUnixMillis(signoff::util::ToUnixMillis(tp)) == tp);
  assert(signoff::util::ToProto(tp).seconds() == 1717229109);
}

} // namespace

int main() {
  TestAddMonthsClampsToMonthEnd();
  TestAddDaysCrossesMonths();
  TestDaysBetweenCountsDateBoundaries();
  TestParseRejectsMalformedInput();
  TestFormatTimestampIsUtcIso();
  TestProtoAndMillisConversions();

  std::cout << "signoff_reporter_unit_time: pass\n";
  return 0;
}
