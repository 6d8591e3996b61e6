#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace signoff::grpc {

/*
  Maps service exceptions onto gRPC status codes.

    util::NotFound         NOT_FOUND            unknown or evicted run id
    util::InvalidArgument  INVALID_ARGUMENT     malformed query or as_of
    util::InvalidState     FAILED_PRECONDITION  no completed run to query
    util::RunFailed        UNAVAILABLE          run id in error_details
    anything else          INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace signoff::grpc
