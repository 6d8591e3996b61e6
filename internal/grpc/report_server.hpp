#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "signoff/report/v1/report_service.grpc.pb.h"
#include "internal/service/report_service.hpp"

namespace signoff::grpc {

class ReportServer final : public signoff::report::v1::SignoffReportService::Service {
public:
  explicit ReportServer(std::shared_ptr<signoff::service::ReportService> svc);

  ::grpc::Status RunReports(::grpc::ServerContext*,
                            const signoff::report::v1::RunReportsRequest*,
                            signoff::report::v1::RunReportsResponse*) override;

  ::grpc::Status GetRun(::grpc::ServerContext*,
                        const signoff::report::v1::GetRunRequest*,
                        signoff::report::v1::GetRunResponse*) override;

  ::grpc::Status ListRuns(::grpc::ServerContext*,
                          const signoff::report::v1::ListRunsRequest*,
                          signoff::report::v1::ListRunsResponse*) override;

  ::grpc::Status ListHistory(::grpc::ServerContext*,
                             const signoff::report::v1::RowQuery*,
                             signoff::report::v1::ListHistoryResponse*) override;

  ::grpc::Status ListQualification(::grpc::ServerContext*,
                                   const signoff::report::v1::RowQuery*,
                                   signoff::report::v1::ListQualificationResponse*) override;

  ::grpc::Status ListNeverSignedOff(::grpc::ServerContext*,
                                    const signoff::report::v1::RowQuery*,
                                    signoff::report::v1::ListNeverSignedOffResponse*) override;

  ::grpc::Status ListRisk(::grpc::ServerContext*,
                          const signoff::report::v1::RowQuery*,
                          signoff::report::v1::ListRiskResponse*) override;

  ::grpc::Status Health(::grpc::ServerContext*,
                        const signoff::report::v1::HealthRequest*,
                        signoff::report::v1::HealthResponse*) override;

private:
  std::shared_ptr<signoff::service::ReportService> service_;
};

} // namespace signoff::grpc
