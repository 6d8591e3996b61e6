#pragma once

#include <memory>
#include <string>

#include "internal/compliance/report_engine.hpp"
#include "internal/util/time.hpp"
#include "signoff/report/v1/report.pb.h"

namespace signoff::reports {

// Immutable output of one completed run.
struct ReportSet {
  std::string                run_id;
  util::TimePoint            as_of{};
  compliance::ReportTables   tables;
};

// Retained run: its summary and, once COMPLETED, its report set.
struct RunEntry {
  signoff::report::v1::RunSummary  summary;
  std::shared_ptr<const ReportSet> reports;
};

} // namespace signoff::reports
