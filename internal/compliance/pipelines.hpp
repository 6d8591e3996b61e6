#pragma once

#include "internal/compliance/compliance_settings.hpp"
#include "internal/compliance/org_attribution.hpp"
#include "internal/compliance/report_rows.hpp"
#include "internal/util/time.hpp"

namespace signoff::snapshot {
class Snapshot;
}

namespace signoff::compliance {

/*
  Inputs shared by the four output pipelines of one run. Everything is
  read-only; pipelines never read the clock.
*/
struct PipelineContext {
  const snapshot::Snapshot&     snapshot;
  const ComplianceSettings&     settings;
  const OrgAttributionResolver& attribution;
  util::TimePoint               as_of;
};

// History window, Policy A. One row per surviving (contract, event); a
// contract without surviving events yields one has_signoff=false row.
PipelineResult<HistoryRow> RunHistoryPipeline(const PipelineContext& ctx);

// Qualification window, Policy B, distinct rows.
PipelineResult<QualificationRow> RunQualificationPipeline(const PipelineContext& ctx);

// History window, anti-join against the raw event store, one row per
// responsible user.
PipelineResult<NeverSignedOffRow> RunNeverSignedOffPipeline(const PipelineContext& ctx);

// Risk window, Policy C, one row per responsible user.
PipelineResult<RiskRow> RunRiskPipeline(const PipelineContext& ctx);

} // namespace signoff::compliance
