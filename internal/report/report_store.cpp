#include "report_store.hpp"

#include <algorithm>
#include <mutex>

#include "internal/util/errors.hpp"

namespace signoff::reports {

using signoff::report::v1::RUN_STATUS_COMPLETED;
using signoff::report::v1::RunSummary;

namespace {

bool IsCompleted(const RunEntry& entry) {
  return entry.summary.status() == RUN_STATUS_COMPLETED && entry.reports != nullptr;
}

} // namespace

ReportStore::ReportStore(std::size_t retained_runs) : retained_runs_(std::max<std::size_t>(retained_runs, 1)) {
}

void ReportStore::Publish(RunEntry entry) {
  std::unique_lock lock(mutex_);
  auto it = std::find_if(runs_.begin(), runs_.end(), [&](const RunEntry& e) { return e.summary.run_id() == entry.summary.run_id(); });
  if (it != runs_.end()) {
    *it = std::move(entry);
  } else {
    runs_.push_front(std::move(entry));
  }
  Trim();
}

void ReportStore::Trim() {
  const auto latest_completed = std::find_if(runs_.begin(), runs_.end(), IsCompleted);
  const bool has_completed    = latest_completed != runs_.end();
  const auto keep             = has_completed ? static_cast<std::size_t>(latest_completed - runs_.begin()) : std::size_t{0};

  // Evict from the back. The newest entry and the newest completed entry
  // always stay, so the limit can be exceeded by one.
  std::size_t index = runs_.size();
  while (runs_.size() > retained_runs_ && index > 1) {
    --index;
    if (has_completed && index == keep) continue;
    runs_.erase(runs_.begin() + static_cast<std::ptrdiff_t>(index));
  }
}

std::vector<RunSummary> ReportStore::ListRuns() const {
  std::shared_lock lock(mutex_);
  std::vector<RunSummary> out;
  out.reserve(runs_.size());
  for (const auto& entry : runs_) out.push_back(entry.summary);
  return out;
}

RunSummary ReportStore::GetRun(const std::string& run_id) const {
  std::shared_lock lock(mutex_);
  for (const auto& entry : runs_) {
    if (entry.summary.run_id() == run_id) return entry.summary;
  }
  throw util::NotFound("run not found: " + run_id);
}

std::shared_ptr<const ReportSet> ReportStore::Resolve(const std::string& run_id) const {
  std::shared_lock lock(mutex_);
  if (run_id.empty()) {
    auto it = std::find_if(runs_.begin(), runs_.end(), IsCompleted);
    if (it == runs_.end()) {
      throw util::InvalidState("no completed report run yet");
    }
    return it->reports;
  }

  for (const auto& entry : runs_) {
    if (entry.summary.run_id() != run_id) continue;
    if (!IsCompleted(entry)) {
      throw util::InvalidState("run " + run_id + " has no reports (status " + signoff::report::v1::RunStatus_Name(entry.summary.status()) + ")");
    }
    return entry.reports;
  }
  throw util::NotFound("run not found: " + run_id);
}

std::optional<std::string> ReportStore::LatestCompletedRunId() const {
  std::shared_lock lock(mutex_);
  auto it = std::find_if(runs_.begin(), runs_.end(), IsCompleted);
  if (it == runs_.end()) return std::nullopt;
  return it->summary.run_id();
}

std::size_t ReportStore::Size() const {
  std::shared_lock lock(mutex_);
  return runs_.size();
}

} // namespace signoff::reports
