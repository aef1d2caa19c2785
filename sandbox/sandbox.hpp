#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/optional.h"

namespace sandbox {

// Disables the limit it is assigned to.
static const constexpr int64_t kUnlimited = -1;

// Maximum number of entries in RunConfig::args and RunConfig::env.
static const constexpr size_t kMaxArgs = 255;
static const constexpr size_t kMaxEnv = 255;

// How the submitted program behaved.
enum class Outcome {
  kSuccess = 0,
  kCpuTimeLimitExceeded = 1,
  kRealTimeLimitExceeded = 2,
  kMemoryLimitExceeded = 3,
  kRuntimeError = 4,
  kSystemError = 5,
};

// Whether the sandbox itself failed to set up or supervise the run. The
// numeric values are the wire codes used by the judge front ends.
enum class Fault {
  kNone = 0,
  kInvalidConfig = -1,
  kForkFailed = -2,
  kWatchdogFailed = -3,
  kWaitFailed = -4,
  kPrivilegeRequired = -5,
  kFilterLoadFailed = -6,
  kLimitSetFailed = -7,
  kIORedirectFailed = -8,
  kPrivilegeDropFailed = -9,
  kExecFailed = -10,
  // Never produced by Run(); reserved for callers that run a checker.
  kExternalCheckerError = -11,
};

const char* OutcomeName(Outcome outcome);
const char* FaultName(Fault fault);

// Settings to execute the program in the sandbox. Numeric limits accept
// kUnlimited, except for the stack size.
struct RunConfig {
  int64_t max_cpu_time_millis = kUnlimited;
  int64_t max_real_time_millis = kUnlimited;
  int64_t max_memory_bytes = kUnlimited;
  int64_t max_stack_bytes = 16 * 1024 * 1024;
  int64_t max_process_number = kUnlimited;
  int64_t max_output_size_bytes = kUnlimited;
  // If set, memory is not capped by the OS and the limit is only compared
  // against the measured peak usage after the program exits.
  bool memory_limit_check_only = false;

  std::string exe_path;
  // Empty paths leave the corresponding stream untouched.
  std::string input_path;
  std::string output_path;
  std::string error_path;
  // Does not include argv[0], which is always exe_path.
  std::vector<std::string> args;
  std::vector<std::string> env;

  std::string log_path;
  absl::optional<std::string> seccomp_rule_name;

  uid_t uid = 65534;
  gid_t gid = 65534;
};

// Results of the execution.
struct RunResult {
  int64_t cpu_time_millis = 0;
  int64_t real_time_millis = 0;
  int64_t memory_bytes = 0;
  int32_t signal = 0;
  int32_t exit_code = 0;
  Outcome outcome = Outcome::kSuccess;
  Fault fault = Fault::kNone;
  std::string error_message;
};

// Runs config.exe_path in a child process with the given limits, waits for it
// and classifies the run. Blocks until the child is gone. Safe to call from
// multiple threads at once.
RunResult Run(const RunConfig& config);

}  // namespace sandbox

#endif
