#pragma once

#include <filesystem>

#include "internal/export/report_exporter.hpp"

namespace signoff::exporter {

/*
  Writes each run as four Arrow IPC files:

      <root>/<run_id>/history.arrow
      <root>/<run_id>/qualification.arrow
      <root>/<run_id>/never_signed_off.arrow
      <root>/<run_id>/risk.arrow

  Each file is written to "<name>.tmp" and renamed into place.
*/
class ArrowReportExporter : public ReportExporter {
 public:
  explicit ArrowReportExporter(std::filesystem::path root);

  void Export(const signoff::reports::ReportSet& reports) override;

 private:
  std::filesystem::path root_;
};

} // namespace signoff::exporter
