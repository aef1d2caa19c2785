#ifndef SANDBOX_VALIDATION_HPP
#define SANDBOX_VALIDATION_HPP

#include <string>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Checks a config before anything is created: the executable must be an
// existing regular file, limits must be positive or kUnlimited, args and env
// must fit their bounds, uid and gid must exist and the syscall policy, if
// any, must be in the catalog. Returns false and sets error_msg otherwise.
bool ValidateConfig(const RunConfig& config, std::string* error_msg);

}  // namespace sandbox

#endif
