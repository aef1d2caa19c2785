#ifndef SANDBOX_PRIVILEGES_HPP
#define SANDBOX_PRIVILEGES_HPP

#include <sys/types.h>

#include <string>

#include "sandbox/sandbox.hpp"
#include "sandbox/setup_error.hpp"

namespace sandbox {

// Identity the child switches to before exec.
struct Identity {
  uid_t uid = 0;
  gid_t gid = 0;
  // Whether supplementary groups must be reset, which needs CAP_SETGID.
  bool reset_groups = false;
};

// Checks that the calling process may switch to config.uid/config.gid and
// install a syscall filter: either it is root, or it already runs with exactly
// that identity. Runs in the parent. Returns false and sets error_msg
// otherwise.
bool CheckPrivileges(const RunConfig& config, Identity* identity,
                     std::string* error_msg);

// Switches group, then user id (real, effective and saved) and checks that
// no id of the previous identity is left. Executed in the child after the
// syscall filter is installed; only uses syscalls the filter permits.
bool DropPrivileges(const Identity& identity, SetupError* error);

}  // namespace sandbox

#endif
