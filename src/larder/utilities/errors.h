#ifndef LARDER_UTILITIES_ERRORS_H
#define LARDER_UTILITIES_ERRORS_H

#include <larder/core/exception.h>

namespace larder {

// the message that a lower layer (the OS, libcurl, libpng, a JSON parser)
// gave for a failure
LARDER_DEFINE_ERROR_INFO(string, internal_error_message)

// Thrown when something that larder itself should have guaranteed turns out
// not to hold (e.g., a mock HTTP session receiving a request that isn't in
// its script).
LARDER_DEFINE_EXCEPTION(internal_check_failed)

} // namespace larder

#endif
