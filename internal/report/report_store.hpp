#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/report/report_set.hpp"

namespace signoff::reports {

/*
  ReportStore

  Bounded, newest-first list of retained runs. Report sets are published
  as shared_ptr<const ReportSet> so readers keep a consistent view while a
  newer run replaces them. The latest completed run is never evicted, so a
  burst of failed runs cannot make the service unqueryable, and neither is
  the newest entry, so a run in progress stays visible to GetRun.
*/
class ReportStore {
 public:
  explicit ReportStore(std::size_t retained_runs);

  // Inserts a new run at the front or replaces the entry with the same run id.
  void Publish(RunEntry entry);

  std::vector<signoff::report::v1::RunSummary> ListRuns() const;

  // Throws util::NotFound.
  signoff::report::v1::RunSummary GetRun(const std::string& run_id) const;

  /*
    Report set to query.
      empty run_id    latest completed run, util::InvalidState when none
      unknown run_id  util::NotFound
      not completed   util::InvalidState
  */
  std::shared_ptr<const ReportSet> Resolve(const std::string& run_id) const;

  std::optional<std::string> LatestCompletedRunId() const;
  std::size_t                Size() const;

 private:
  void Trim();

  const std::size_t       retained_runs_;
  mutable std::shared_mutex mutex_;
  std::deque<RunEntry>    runs_;
};

} // namespace signoff::reports
