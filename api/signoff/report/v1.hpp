#pragma once

// Umbrella header for the signoff.report.v1 protobuf API (message types only;
// the gRPC stubs live in report_service.grpc.pb.h).

#include "signoff/report/v1/report.pb.h"
#include "signoff/report/v1/report_service.pb.h"
