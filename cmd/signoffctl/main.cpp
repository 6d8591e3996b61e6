#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/util/time.hpp"
#include "signoff/report/v1/report_service.grpc.pb.h"
#include "signoff/report/v1.hpp"

using namespace signoff::report::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  signoffctl <addr> run [as_of]\n"
            << "  signoffctl <addr> runs\n"
            << "  signoffctl <addr> run-info <run_id>\n"
            << "  signoffctl <addr> history|qualification|never|risk [--run R] [--contract C] [--from YYYY-MM-DD] [--to YYYY-MM-DD]\n"
            << "                                                 [--page-size N] [--page-token T]\n"
            << "  signoffctl <addr> health\n";
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        json_status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!json_status.ok()) {
    std::cerr << "failed to render response: " << json_status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

static std::optional<RowQuery> ParseRowQuery(int argc, char** argv, int first) {
  RowQuery query;
  for (int i = first; i < argc; i += 2) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return std::nullopt;
    }
    const std::string value = argv[i + 1];

    if (flag == "--run") {
      query.set_run_id(value);
    } else if (flag == "--contract") {
      query.set_booking_contract(value);
    } else if (flag == "--from") {
      query.set_date_from(value);
    } else if (flag == "--to") {
      query.set_date_to(value);
    } else if (flag == "--page-size") {
      try {
        query.set_page_size(static_cast<uint32_t>(std::stoul(value)));
      } catch (const std::exception&) {
        std::cerr << "invalid page size: " << value << "\n";
        return std::nullopt;
      }
    } else if (flag == "--page-token") {
      query.set_page_token(value);
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return std::nullopt;
    }
  }
  return query;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SignoffReportService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "run") {
    RunReportsRequest req;
    if (argc >= 4) {
      auto as_of = signoff::util::ParseTimestamp(argv[3]);
      if (!as_of) {
        std::cerr << "invalid as_of: " << argv[3] << "\n";
        return 1;
      }
      *req.mutable_as_of() = signoff::util::ToProto(*as_of);
    }

    RunReportsResponse resp;
    return Print(stub->RunReports(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "runs") {
    ListRunsResponse resp;
    return Print(stub->ListRuns(&ctx, ListRunsRequest{}, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "run-info") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetRunRequest req;
    req.set_run_id(argv[3]);

    GetRunResponse resp;
    return Print(stub->GetRun(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "history" || cmd == "qualification" || cmd == "never" || cmd == "risk") {
    auto query = ParseRowQuery(argc, argv, 3);
    if (!query) return 1;

    if (cmd == "history") {
      ListHistoryResponse resp;
      return Print(stub->ListHistory(&ctx, *query, &resp), resp);
    }
    if (cmd == "qualification") {
      ListQualificationResponse resp;
      return Print(stub->ListQualification(&ctx, *query, &resp), resp);
    }
    if (cmd == "never") {
      ListNeverSignedOffResponse resp;
      return Print(stub->ListNeverSignedOff(&ctx, *query, &resp), resp);
    }
    ListRiskResponse resp;
    return Print(stub->ListRisk(&ctx, *query, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    HealthResponse resp;
    return Print(stub->Health(&ctx, HealthRequest{}, &resp), resp);
  }

  Usage();
  return 1;
}
