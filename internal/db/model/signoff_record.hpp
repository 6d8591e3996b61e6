#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace signoff::db::model {

/*
  Append-only signoff event. Rows are never updated except for the
  soft-delete flag. Dimension ids of 0 never match a dimension row.
*/
struct SignoffRecord {
  std::int64_t signoff_id = 0;
  std::string  booking_contract;
  std::int64_t dc_user_id = 0;
  util::TimePoint create_dtm{};

  std::int64_t signoff_method_id       = 0;
  std::int64_t sign_off_identity_id    = 0;
  std::int64_t defer_signoff_reason_id = 0;
  std::int64_t dc_engagement_id        = 0;
  std::int64_t signoff_event_id        = 0;

  std::string notes;
  bool        is_deleted = false;
};

} // namespace signoff::db::model
