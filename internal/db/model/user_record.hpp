#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace signoff::db::model {

struct UserRecord {
  std::int64_t user_id = 0;
  std::string  user_title;
  std::string  cco_id; // login identity, e.g. "jdoe@cisco.com"
  bool         is_deleted = false;
};

// Employee row of the organizational hierarchy, keyed by the raw employee id.
struct OrgHierarchyRecord {
  std::string                emp_cco_id;
  std::optional<std::string> emp_cco_id_masked;
  std::string                emp_name;

  std::string level6_worker_name;
  std::string level7_worker_name;
  std::string level8_worker_name;
  std::string level9_worker_name;

  std::string mgr_name;
  std::string theater;
};

} // namespace signoff::db::model
