#ifndef SANDBOX_FILTER_HPP
#define SANDBOX_FILTER_HPP

#include <linux/filter.h>

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"
#include "sandbox/setup_error.hpp"

namespace sandbox {

// A syscall filter compiled to BPF, ready to be installed. An empty program
// means no filtering.
struct FilterProgram {
  std::vector<struct sock_filter> instructions;
  bool empty() const { return instructions.empty(); }
};

// Compiles the policy named in the config. Besides the policy's own rules,
// the program only lets execve run config.exe_path (compared by address, so
// the caller must exec exactly config.exe_path.c_str()) and, for whitelist
// policies, permits the privilege switch to config.uid/config.gid. Runs in the
// parent. Returns false and sets error_msg on failure.
bool CompileFilter(const RunConfig& config, FilterProgram* program,
                   std::string* error_msg);

// Sets no_new_privs and installs the program in the calling process. The
// filter cannot be removed afterwards. Executed in the child before exec;
// does not allocate.
bool InstallFilter(const FilterProgram& program, SetupError* error);

}  // namespace sandbox

#endif
