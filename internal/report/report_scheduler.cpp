#include "report_scheduler.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/report/run_coordinator.hpp"

namespace signoff::reports {

ReportScheduler::ReportScheduler(std::shared_ptr<RunCoordinator> coordinator, std::chrono::seconds interval)
    : coordinator_(std::move(coordinator)), interval_(interval) {
}

ReportScheduler::~ReportScheduler() {
  Stop();
}

void ReportScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&ReportScheduler::Run, this);
}

void ReportScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ReportScheduler::Run() {
  SIGNOFF_LOG_INFO("Report scheduler started", {signoff::observability::IntField("interval_sec", interval_.count())});

  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    try {
      coordinator_->Run();
    } catch (const std::exception& e) {
      SIGNOFF_LOG_ERROR("Scheduled report run failed", {signoff::observability::StringField("error", e.what())});
    }
    lock.lock();
  }

  SIGNOFF_LOG_INFO("Report scheduler stopped");
}

} // namespace signoff::reports
