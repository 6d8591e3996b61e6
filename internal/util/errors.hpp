#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace signoff::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A report run that started but published no reports. Earlier completed
// runs stay queryable, so callers may retry.
class RunFailed : public std::runtime_error {
 public:
  RunFailed(std::string run_id, const std::string& cause)
      : std::runtime_error("report run " + run_id + " failed: " + cause), run_id_(std::move(run_id)) {
  }

  const std::string& run_id() const {
    return run_id_;
  }

 private:
  std::string run_id_;
};

} // namespace signoff::util
