#include "report_server.hpp"
#include "grpc_error.hpp"

namespace signoff::grpc {

using namespace signoff::report::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

ReportServer::ReportServer(std::shared_ptr<signoff::service::ReportService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ReportServer::RunReports(::grpc::ServerContext*, const RunReportsRequest* req, RunReportsResponse* resp) {
  return Handle([&] { *resp = service_->RunReports(*req); });
}

::grpc::Status ReportServer::GetRun(::grpc::ServerContext*, const GetRunRequest* req, GetRunResponse* resp) {
  return Handle([&] { *resp = service_->GetRun(*req); });
}

::grpc::Status ReportServer::ListRuns(::grpc::ServerContext*, const ListRunsRequest* req, ListRunsResponse* resp) {
  return Handle([&] { *resp = service_->ListRuns(*req); });
}

::grpc::Status ReportServer::ListHistory(::grpc::ServerContext*, const RowQuery* req, ListHistoryResponse* resp) {
  return Handle([&] { *resp = service_->ListHistory(*req); });
}

::grpc::Status ReportServer::ListQualification(::grpc::ServerContext*, const RowQuery* req, ListQualificationResponse* resp) {
  return Handle([&] { *resp = service_->ListQualification(*req); });
}

::grpc::Status ReportServer::ListNeverSignedOff(::grpc::ServerContext*, const RowQuery* req, ListNeverSignedOffResponse* resp) {
  return Handle([&] { *resp = service_->ListNeverSignedOff(*req); });
}

::grpc::Status ReportServer::ListRisk(::grpc::ServerContext*, const RowQuery* req, ListRiskResponse* resp) {
  return Handle([&] { *resp = service_->ListRisk(*req); });
}

::grpc::Status ReportServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  return Handle([&] { *resp = service_->Health(*req); });
}

} // namespace signoff::grpc
