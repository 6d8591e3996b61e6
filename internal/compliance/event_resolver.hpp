#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/signoff_record.hpp"
#include "internal/util/time.hpp"

namespace signoff::compliance {

using SignoffList = std::vector<const db::model::SignoffRecord*>;

/*
  Latest-event resolution policies.

  Every function takes the non-deleted events of ONE contract; grouping by
  contract is the caller's job (Snapshot::LiveSignoffs). No result depends
  on the order of the input list.
*/

// Ranking key of Policy A: later timestamp wins, then the larger user id.
struct LatestKey {
  util::TimePoint create_dtm{};
  std::int64_t    dc_user_id = 0;

  auto operator<=>(const LatestKey&) const = default;
};

struct AnnotatedSignoff {
  const db::model::SignoffRecord* event = nullptr;
  bool                            is_last_signoff = false;
};

// Rank-1 key over non-deferred events, nullopt when there are none.
std::optional<LatestKey> ResolveLatestKey(const SignoffList& events, std::int64_t deferred_method_id);

// Policy A: every event, flagged when its (timestamp, user) equals the
// rank-1 key. Several events may carry the flag.
std::vector<AnnotatedSignoff> AnnotateLatest(const SignoffList& events, std::int64_t deferred_method_id);

// Policy B: all events sharing the maximum timestamp, any method.
SignoffList SelectLatestAnyMethod(const SignoffList& events);

// Policy C: maximum timestamp over non-deferred events.
std::optional<util::TimePoint> LatestNonDeferredTimestamp(const SignoffList& events, std::int64_t deferred_method_id);

} // namespace signoff::compliance
