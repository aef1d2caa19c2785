#include "util/error.hpp"

#include <string.h>

namespace util {

const char* StrError(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string StrError(int err) {
  char buf[kStrErrorBufSize] = {};
  return StrError(err, buf, kStrErrorBufSize);
}

}  // namespace util
