#pragma once

#include "service_context.hpp"
#include "signoff/report/v1.hpp"

namespace signoff::service {

class ReportService {
public:
  explicit ReportService(ServiceContext ctx);

  signoff::report::v1::RunReportsResponse
  RunReports(const signoff::report::v1::RunReportsRequest& req);

  signoff::report::v1::GetRunResponse
  GetRun(const signoff::report::v1::GetRunRequest& req);

  signoff::report::v1::ListRunsResponse
  ListRuns(const signoff::report::v1::ListRunsRequest& req);

  signoff::report::v1::ListHistoryResponse
  ListHistory(const signoff::report::v1::RowQuery& req);

  signoff::report::v1::ListQualificationResponse
  ListQualification(const signoff::report::v1::RowQuery& req);

  signoff::report::v1::ListNeverSignedOffResponse
  ListNeverSignedOff(const signoff::report::v1::RowQuery& req);

  signoff::report::v1::ListRiskResponse
  ListRisk(const signoff::report::v1::RowQuery& req);

  signoff::report::v1::HealthResponse
  Health(const signoff::report::v1::HealthRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace signoff::service
