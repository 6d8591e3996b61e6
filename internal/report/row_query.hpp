#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/compliance/report_rows.hpp"
#include "internal/util/time.hpp"
#include "signoff/report/v1/report_service.pb.h"

namespace signoff::reports {

struct RowFilter {
  std::string               booking_contract; // empty matches all
  std::optional<util::Date> date_from;
  std::optional<util::Date> date_to;

  bool HasDateRange() const {
    return date_from.has_value() || date_to.has_value();
  }
};

struct PageRequest {
  std::size_t offset    = 0;
  std::size_t page_size = 0;
};

template <typename Row>
struct Page {
  std::vector<const Row*> rows;
  std::string             next_page_token;
  std::size_t             total_size = 0;
};

// Throws util::InvalidArgument on malformed dates or date_from > date_to.
RowFilter ParseRowFilter(const signoff::report::v1::RowQuery& query);

// page_size 0 selects default_page_size; larger values are capped at
// max_page_size. Throws util::InvalidArgument on a malformed page token.
PageRequest ParsePageRequest(const signoff::report::v1::RowQuery& query, std::size_t default_page_size, std::size_t max_page_size);

// Column used for contract filtering and the date the range applies to.
inline const std::string& ContractOf(const compliance::HistoryRow& row) {
  return row.contract.booking_contract;
}
inline const std::string& ContractOf(const compliance::QualificationRow& row) {
  return row.booking_contract;
}
inline const std::string& ContractOf(const compliance::NeverSignedOffRow& row) {
  return row.contract.booking_contract;
}
inline const std::string& ContractOf(const compliance::RiskRow& row) {
  return row.contract.booking_contract;
}

inline std::optional<util::TimePoint> SignoffDateOf(const compliance::HistoryRow& row) {
  return row.create_dtm;
}
inline std::optional<util::TimePoint> SignoffDateOf(const compliance::QualificationRow& row) {
  return row.last_signoff_date;
}
inline std::optional<util::TimePoint> SignoffDateOf(const compliance::NeverSignedOffRow&) {
  return std::nullopt;
}
inline std::optional<util::TimePoint> SignoffDateOf(const compliance::RiskRow& row) {
  return row.last_signoff_date;
}

template <typename Row>
bool Matches(const RowFilter& filter, const Row& row) {
  if (!filter.booking_contract.empty() && ContractOf(row) != filter.booking_contract) return false;
  if (!filter.HasDateRange()) return true;

  const auto signoff_date = SignoffDateOf(row);
  if (!signoff_date) return false;
  const auto date = util::ToDate(*signoff_date);
  if (filter.date_from && date < *filter.date_from) return false;
  if (filter.date_to && date > *filter.date_to) return false;
  return true;
}

// Filters rows in their stored order and returns one page of them.
template <typename Row>
Page<Row> QueryRows(const std::vector<Row>& rows, const RowFilter& filter, const PageRequest& page) {
  Page<Row>   out;
  std::size_t matched = 0;
  for (const auto& row : rows) {
    if (!Matches(filter, row)) continue;
    if (matched >= page.offset && out.rows.size() < page.page_size) {
      out.rows.push_back(&row);
    }
    ++matched;
  }

  out.total_size = matched;
  const auto next = page.offset + out.rows.size();
  if (!out.rows.empty() && next < matched) {
    out.next_page_token = std::to_string(next);
  }
  return out;
}

} // namespace signoff::reports
