#include "event_resolver.hpp"

namespace signoff::compliance {

namespace {

// Fold keeping the maximum of `key(e)` over events accepted by `keep`.
template <typename Key, typename KeyFn, typename Keep>
std::optional<Key> FoldMax(const SignoffList& events, KeyFn&& key, Keep&& keep) {
  std::optional<Key> best;
  for (const auto* event : events) {
    if (!keep(*event)) continue;
    Key candidate = key(*event);
    if (!best || *best < candidate) best = candidate;
  }
  return best;
}

} // namespace

std::optional<LatestKey> ResolveLatestKey(const SignoffList& events, std::int64_t deferred_method_id) {
  return FoldMax<LatestKey>(
      events, [](const db::model::SignoffRecord& e) { return LatestKey{e.create_dtm, e.dc_user_id}; },
      [deferred_method_id](const db::model::SignoffRecord& e) { return e.signoff_method_id != deferred_method_id; });
}

std::vector<AnnotatedSignoff> AnnotateLatest(const SignoffList& events, std::int64_t deferred_method_id) {
  const auto winner = ResolveLatestKey(events, deferred_method_id);

  std::vector<AnnotatedSignoff> annotated;
  annotated.reserve(events.size());
  for (const auto* event : events) {
    const bool is_last = winner && LatestKey{event->create_dtm, event->dc_user_id} == *winner;
    annotated.push_back({event, is_last});
  }
  return annotated;
}

SignoffList SelectLatestAnyMethod(const SignoffList& events) {
  const auto latest = FoldMax<util::TimePoint>(
      events, [](const db::model::SignoffRecord& e) { return e.create_dtm; }, [](const db::model::SignoffRecord&) { return true; });

  SignoffList selected;
  if (!latest) return selected;
  for (const auto* event : events) {
    if (event->create_dtm == *latest) selected.push_back(event);
  }
  return selected;
}

std::optional<util::TimePoint> LatestNonDeferredTimestamp(const SignoffList& events, std::int64_t deferred_method_id) {
  return FoldMax<util::TimePoint>(
      events, [](const db::model::SignoffRecord& e) { return e.create_dtm; },
      [deferred_method_id](const db::model::SignoffRecord& e) { return e.signoff_method_id != deferred_method_id; });
}

} // namespace signoff::compliance
