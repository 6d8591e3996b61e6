#include "row_query.hpp"

#include <algorithm>
#include <charconv>

#include "internal/util/errors.hpp"

namespace signoff::reports {

namespace {

std::optional<util::Date> ParseOptionalDate(const std::string& text, const char* field) {
  if (text.empty()) return std::nullopt;
  auto date = util::ParseDate(text);
  if (!date) {
    throw util::InvalidArgument(std::string(field) + " must be YYYY-MM-DD, got '" + text + "'");
  }
  return date;
}

} // namespace

RowFilter ParseRowFilter(const signoff::report::v1::RowQuery& query) {
  RowFilter filter;
  filter.booking_contract = query.booking_contract();
  filter.date_from        = ParseOptionalDate(query.date_from(), "date_from");
  filter.date_to          = ParseOptionalDate(query.date_to(), "date_to");
  if (filter.date_from && filter.date_to && *filter.date_from > *filter.date_to) {
    throw util::InvalidArgument("date_from must not be after date_to");
  }
  return filter;
}

PageRequest ParsePageRequest(const signoff::report::v1::RowQuery& query, std::size_t default_page_size, std::size_t max_page_size) {
  PageRequest page;
  page.page_size = query.page_size() == 0 ? default_page_size : query.page_size();
  page.page_size = std::max<std::size_t>(1, std::min(page.page_size, max_page_size));

  const auto& token = query.page_token();
  if (!token.empty()) {
    const auto* begin     = token.data();
    const auto* end       = token.data() + token.size();
    auto [ptr, ec]        = std::from_chars(begin, end, page.offset);
    if (ec != std::errc() || ptr != end) {
      throw util::InvalidArgument("invalid page_token: " + token);
    }
  }
  return page;
}

} // namespace signoff::reports
