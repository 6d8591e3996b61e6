#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace signoff::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* failed = dynamic_cast<const util::RunFailed*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what(), failed->run_id()};
  }

  auto code = ::grpc::StatusCode::INTERNAL;
  if (dynamic_cast<const util::NotFound*>(&e)) {
    code = ::grpc::StatusCode::NOT_FOUND;
  } else if (dynamic_cast<const util::InvalidArgument*>(&e)) {
    code = ::grpc::StatusCode::INVALID_ARGUMENT;
  } else if (dynamic_cast<const util::InvalidState*>(&e)) {
    code = ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  return {code, e.what()};
}

} // namespace signoff::grpc
