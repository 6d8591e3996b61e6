#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace signoff::snapshot {
class Snapshot;
}

namespace signoff::compliance {

struct OrgAttribution {
  std::string level6_worker_name;
  std::string level7_worker_name;
  std::string level8_worker_name;
  std::string level9_worker_name;
  std::string emp_cco_id_masked;
  std::string mgr_name;
  std::string theater;

  bool operator==(const OrgAttribution&) const = default;

  // Every field "Not Assigned".
  static const OrgAttribution& Sentinel();
};

/*
  OrgAttributionResolver

  Maps a user id to the org hierarchy entry whose
  emp_cco_id + "@" + org_domain equals the user's cco_id. Only non-deleted
  users and entries with a masked id take part. Anything that does not
  match resolves to the sentinel; a matched entry's empty fields are
  replaced by "Not Assigned" one by one.

  Several entries matching one user resolve to the smallest masked id and
  are counted in AmbiguousMatches().

  Built once per snapshot; Resolve() is const and safe to call from
  concurrent pipelines.
*/
class OrgAttributionResolver {
 public:
  OrgAttributionResolver(const snapshot::Snapshot& snapshot, const std::string& org_domain);

  const OrgAttribution& Resolve(std::optional<std::int64_t> user_id) const;

  std::uint64_t AmbiguousMatches() const {
    return ambiguous_matches_;
  }

 private:
  std::unordered_map<std::int64_t, OrgAttribution> by_user_;
  std::uint64_t                                    ambiguous_matches_ = 0;
};

} // namespace signoff::compliance
