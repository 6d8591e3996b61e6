#pragma once

namespace signoff::reports {
struct ReportSet;
}

namespace signoff::exporter {

/*
  Sink for completed report sets. Called by the run coordinator after a
  run has been published; a failing export never fails the run.
*/
class ReportExporter {
 public:
  virtual ~ReportExporter() = default;

  virtual void Export(const signoff::reports::ReportSet& reports) = 0;
};

} // namespace signoff::exporter
