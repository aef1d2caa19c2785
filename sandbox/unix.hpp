#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/audit_log.hpp"
#include "sandbox/filter.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/privileges.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Supervises a single run: prepares everything the child needs, forks, and
// waits for the child while the watchdog enforces the wall time limit. One
// instance per run.
class Unix {
 public:
  explicit Unix(const RunConfig& config) : config_(config) {}

  Unix(const Unix&) = delete;
  Unix& operator=(const Unix&) = delete;
  Unix(Unix&&) = delete;
  Unix& operator=(Unix&&) = delete;
  ~Unix();

  RunResult Execute();

 private:
  // Validates the config and computes everything the child will need, so
  // that nothing is allocated between fork and exec. Returns the fault.
  Fault Prepare(std::string* error_msg);

  // Creates the error pipe.
  bool Setup(std::string* error_msg);

  // Creates the child process and saves its PID in child_pid_. The child
  // process executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. Runs the setup steps in
  // order and execs the program; the first failing step is reported on the
  // error pipe and the child exits without running the program.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing it if it exceeds the wall
  // time limit, and fills the termination status and usage in result.
  void Wait(RunResult* result);

  const RunConfig& config_;
  AuditLog audit_;
  ResourceLimits limits_;
  Identity identity_;
  FilterProgram filter_;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;

  int pipe_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  std::chrono::steady_clock::time_point start_;
  bool killed_by_watchdog_ = false;
};

}  // namespace sandbox

#endif
