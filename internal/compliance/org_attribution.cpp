#include "org_attribution.hpp"

#include <string_view>
#include <vector>

#include "internal/compliance/compliance_settings.hpp"
#include "internal/snapshot/snapshot.hpp"

namespace signoff::compliance {

namespace {

std::string OrNotAssigned(const std::string& value) {
  return value.empty() ? std::string(kNotAssigned) : value;
}

OrgAttribution FromEntry(const db::model::OrgHierarchyRecord& entry) {
  OrgAttribution attribution;
  attribution.level6_worker_name = OrNotAssigned(entry.level6_worker_name);
  attribution.level7_worker_name = OrNotAssigned(entry.level7_worker_name);
  attribution.level8_worker_name = OrNotAssigned(entry.level8_worker_name);
  attribution.level9_worker_name = OrNotAssigned(entry.level9_worker_name);
  attribution.emp_cco_id_masked  = OrNotAssigned(entry.emp_cco_id_masked.value_or(""));
  attribution.mgr_name           = OrNotAssigned(entry.mgr_name);
  attribution.theater            = OrNotAssigned(entry.theater);
  return attribution;
}

} // namespace

const OrgAttribution& OrgAttribution::Sentinel() {
  static const OrgAttribution sentinel{
      std::string(kNotAssigned), std::string(kNotAssigned), std::string(kNotAssigned), std::string(kNotAssigned),
      std::string(kNotAssigned), std::string(kNotAssigned), std::string(kNotAssigned),
  };
  return sentinel;
}

OrgAttributionResolver::OrgAttributionResolver(const snapshot::Snapshot& snapshot, const std::string& org_domain) {
  std::unordered_map<std::string, std::vector<const db::model::OrgHierarchyRecord*>> by_login;
  for (const auto& entry : snapshot.OrgHierarchy()) {
    if (!entry.emp_cco_id_masked) continue;
    by_login[entry.emp_cco_id + "@" + org_domain].push_back(&entry);
  }

  for (const auto& user : snapshot.Users()) {
    if (user.is_deleted) continue;

    auto it = by_login.find(user.cco_id);
    if (it == by_login.end()) continue;

    const auto& candidates = it->second;
    const auto* chosen     = candidates.front();
    for (const auto* candidate : candidates) {
      if (*candidate->emp_cco_id_masked < *chosen->emp_cco_id_masked) chosen = candidate;
    }
    if (candidates.size() > 1) ++ambiguous_matches_;

    by_user_.emplace(user.user_id, FromEntry(*chosen));
  }
}

const OrgAttribution& OrgAttributionResolver::Resolve(std::optional<std::int64_t> user_id) const {
  if (!user_id) return OrgAttribution::Sentinel();
  auto it = by_user_.find(*user_id);
  return it == by_user_.end() ? OrgAttribution::Sentinel() : it->second;
}

} // namespace signoff::compliance
