#pragma once

#include <string>

namespace signoff::util {

// Random RFC 4122 version 4 UUID in lower-case canonical form, used as
// the id of a report run.
std::string NewRunId();

} // namespace signoff::util
