#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "internal/compliance/compliance_settings.hpp"
#include "internal/util/time.hpp"
#include "signoff/report/v1/report.pb.h"

namespace signoff::db {
class Repository;
}

namespace signoff::exporter {
class ReportExporter;
}

namespace signoff::reports {

class ReportStore;

/*
  RunCoordinator

  Executes one report run end to end:

      load snapshot (one transaction)
      pin as-of (request value, else one clock read)
      compute the four pipelines
      publish to the ReportStore
      export (optional)

  Runs are serialized; a second caller blocks until the first finishes.
  A failed run is published with status FAILED and the exception is
  rethrown; the previous completed run stays queryable.
*/
class RunCoordinator {
 public:
  RunCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReportStore> store, compliance::ComplianceSettings settings,
                 std::shared_ptr<exporter::ReportExporter> exporter = nullptr);

  signoff::report::v1::RunSummary Run(std::optional<util::TimePoint> as_of = std::nullopt);

  const compliance::ComplianceSettings& Settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<ReportStore>              store_;
  compliance::ComplianceSettings            settings_;
  std::shared_ptr<exporter::ReportExporter> exporter_;

  std::mutex run_mutex_;
};

} // namespace signoff::reports
