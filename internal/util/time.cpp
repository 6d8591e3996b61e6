#include "time.hpp"

#include <iomanip>
#include <sstream>

namespace signoff::util {

namespace {

std::optional<int> ParseDigits(std::string_view text, std::size_t pos, std::size_t count) {
  if (pos + count > text.size()) return std::nullopt;
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + (c - '0');
  }
  return value;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

Date ToDate(TimePoint tp) {
  return std::chrono::floor<std::chrono::days>(tp);
}

Date AddDays(Date date, int days) {
  return date + std::chrono::days(days);
}

Date AddMonths(Date date, int months) {
  const std::chrono::year_month_day ymd{date};
  std::chrono::year_month_day       shifted = ymd + std::chrono::months(months);
  if (!shifted.ok()) {
    shifted = std::chrono::year_month_day{shifted.year() / shifted.month() / std::chrono::last};
  }
  return std::chrono::sys_days{shifted};
}

int64_t DaysBetween(TimePoint from, TimePoint to) {
  return (ToDate(to) - ToDate(from)).count();
}

std::optional<Date> ParseDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

  auto y = ParseDigits(text, 0, 4);
  auto m = ParseDigits(text, 5, 2);
  auto d = ParseDigits(text, 8, 2);
  if (!y || !m || !d) return std::nullopt;

  const std::chrono::year_month_day ymd{std::chrono::year(*y), std::chrono::month(static_cast<unsigned>(*m)),
                                        std::chrono::day(static_cast<unsigned>(*d))};
  if (!ymd.ok()) return std::nullopt;
  return std::chrono::sys_days{ymd};
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.day());
  return out.str();
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  if (text.size() < 10) return std::nullopt;

  auto date = ParseDate(text.substr(0, 10));
  if (!date) return std::nullopt;
  if (text.size() == 10) return TimePoint{*date};

  if (text.back() == 'Z') text.remove_suffix(1);
  if (text.size() != 19 || (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') return std::nullopt;

  auto hh = ParseDigits(text, 11, 2);
  auto mm = ParseDigits(text, 14, 2);
  auto ss = ParseDigits(text, 17, 2);
  if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 59) return std::nullopt;

  return TimePoint{*date} + std::chrono::hours(*hh) + std::chrono::minutes(*mm) + std::chrono::seconds(*ss);
}

std::string FormatTimestamp(TimePoint tp) {
  const auto date = ToDate(tp);
  const std::chrono::hh_mm_ss<std::chrono::seconds> time{std::chrono::floor<std::chrono::seconds>(tp - date)};

  std::ostringstream out;
  out << FormatDate(date) << 'T' << std::setfill('0') << std::setw(2) << time.hours().count() << ':' << std::setw(2) << time.minutes().count()
      << ':' << std::setw(2) << time.seconds().count() << 'Z';
  return out.str();
}

} // namespace signoff::util
