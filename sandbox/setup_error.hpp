#ifndef SANDBOX_SETUP_ERROR_HPP
#define SANDBOX_SETUP_ERROR_HPP

#include <cstring>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Failure of one of the child-side setup steps. It is written as-is to the
// error pipe, so it must stay trivially copyable.
struct SetupError {
  static const constexpr size_t kStepLen = 48;

  Fault fault = Fault::kNone;
  int error = 0;
  char step[kStepLen] = {};

  // Records a failure and returns false, for use as `return error->Set(...)`.
  // Does not allocate.
  bool Set(Fault f, const char* what, int err) {
    fault = f;
    error = err;
    strncpy(step, what, kStepLen - 1);  // NOLINT
    step[kStepLen - 1] = '\0';
    return false;
  }
};

}  // namespace sandbox

#endif
