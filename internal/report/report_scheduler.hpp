#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace signoff::reports {

class RunCoordinator;

/*
  Background worker that refreshes the reports.

  Executes:
      RunCoordinator::Run() every interval

  Sleeps on a condition variable so Stop() returns without waiting out the
  interval. A failed run is logged and the loop continues.
*/
class ReportScheduler {
 public:
  ReportScheduler(std::shared_ptr<RunCoordinator> coordinator, std::chrono::seconds interval);
  ~ReportScheduler();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<RunCoordinator> coordinator_;
  std::chrono::seconds            interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace signoff::reports
