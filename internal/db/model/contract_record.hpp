#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace signoff::db::model {

/*
  One booking contract row. Agreement dates are nullable in the source
  tables; a contract missing either date is never eligible.
*/
struct BookingContractRecord {
  std::string booking_contract;

  std::optional<util::Date> agreement_start_date;
  std::optional<util::Date> agreement_end_date;
  bool                      is_deleted = false;

  std::string account_name;
  std::string booking_country;

  std::int64_t booked_theater_id       = 0;
  std::int64_t sold_as_service_type_id = 0;
  std::int64_t buying_program_type_id  = 0;
  std::int64_t sold_as_pricing_type_id = 0;

  double sold_as_sw_allocation = 0.0;
  double sold_as_hw_allocation = 0.0;
};

struct ResponsibleUserRecord {
  std::string  booking_contract;
  std::int64_t dc_user_id = 0;
  bool         is_deleted = false;
};

} // namespace signoff::db::model
