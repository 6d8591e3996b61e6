#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "internal/compliance/compliance_settings.hpp"
#include "internal/compliance/report_rows.hpp"
#include "internal/util/time.hpp"

namespace signoff::snapshot {
class Snapshot;
}

namespace signoff::compliance {

inline constexpr std::string_view kHistoryPipeline        = "history";
inline constexpr std::string_view kQualificationPipeline  = "qualification";
inline constexpr std::string_view kNeverSignedOffPipeline = "never_signed_off";
inline constexpr std::string_view kRiskPipeline           = "risk";

struct ReportTables {
  PipelineResult<HistoryRow>        history;
  PipelineResult<QualificationRow>  qualification;
  PipelineResult<NeverSignedOffRow> never_signed_off;
  PipelineResult<RiskRow>           risk;

  // Users whose cco id matched more than one hierarchy entry.
  std::uint64_t ambiguous_hierarchy_matches = 0;
};

/*
  Runs the four pipelines concurrently over one immutable snapshot and a
  pinned as-of. The result depends only on (snapshot, settings, as_of).
  The first pipeline exception is rethrown after all pipelines finished.
*/
ReportTables ComputeReports(std::shared_ptr<const snapshot::Snapshot> snapshot, const ComplianceSettings& settings, util::TimePoint as_of);

} // namespace signoff::compliance
