#ifndef UTIL_ERROR_HPP
#define UTIL_ERROR_HPP

#include <cstddef>
#include <string>

namespace util {

static const constexpr size_t kStrErrorBufSize = 2048;

// Thread-safe strerror. The pointer returned may or may not point into buf.
const char* StrError(int err, char* buf, size_t buf_size);

std::string StrError(int err);

}  // namespace util

#endif
