#pragma once

#include <cstddef>
#include <string>

namespace YAML {
class Node;
}

namespace signoff::db {
class Repository;
}

namespace signoff::seed {

struct FixtureStats {
  std::size_t contracts         = 0;
  std::size_t signoffs          = 0;
  std::size_t responsible_users = 0;
  std::size_t users             = 0;
  std::size_t org_hierarchy     = 0;
  std::size_t dimensions        = 0;
  std::size_t calendar_dates    = 0;
};

/*
  Loads input tables from a YAML fixture into a repository in one
  transaction. Used to seed the memory backend and by tests.

      contracts:         [{booking_contract, agreement_start_date, ...}]
      signoffs:          [{signoff_id, booking_contract, create_dtm, ...}]
      responsible_users: [{booking_contract, dc_user_id, is_deleted}]
      users:             [{user_id, user_title, cco_id, is_deleted}]
      org_hierarchy:     [{emp_cco_id, emp_cco_id_masked, level6_worker_name, ...}]
      dimensions:        {signoff_method: {1: "Portal"}, theater: {...}, ...}
      calendar:          [{date, fiscal_qtr_sorted_name, fiscal_mth_sorted_name,
                           cal_week_sorted_short_name}]

  Dates are "YYYY-MM-DD", timestamps "YYYY-MM-DDTHH:MM:SSZ". Throws
  util::InvalidArgument on malformed input and std::runtime_error when the
  repository rejects a row; nothing is committed in either case.
*/
class FixtureLoader {
 public:
  static FixtureStats LoadFile(db::Repository& repository, const std::string& path);
  static FixtureStats LoadString(db::Repository& repository, const std::string& yaml_text);

 private:
  static FixtureStats Load(db::Repository& repository, const YAML::Node& root);
};

} // namespace signoff::seed
