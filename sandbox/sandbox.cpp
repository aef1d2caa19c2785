#include "sandbox/sandbox.hpp"

#include "sandbox/unix.hpp"

namespace sandbox {

const char* OutcomeName(Outcome outcome) {
  switch (outcome) {
    case Outcome::kSuccess:
      return "SUCCESS";
    case Outcome::kCpuTimeLimitExceeded:
      return "CPU_TIME_LIMIT_EXCEEDED";
    case Outcome::kRealTimeLimitExceeded:
      return "REAL_TIME_LIMIT_EXCEEDED";
    case Outcome::kMemoryLimitExceeded:
      return "MEMORY_LIMIT_EXCEEDED";
    case Outcome::kRuntimeError:
      return "RUNTIME_ERROR";
    case Outcome::kSystemError:
      return "SYSTEM_ERROR";
  }
  return "UNKNOWN";
}

const char* FaultName(Fault fault) {
  switch (fault) {
    case Fault::kNone:
      return "NONE";
    case Fault::kInvalidConfig:
      return "INVALID_CONFIG";
    case Fault::kForkFailed:
      return "FORK_FAILED";
    case Fault::kWatchdogFailed:
      return "WATCHDOG_FAILED";
    case Fault::kWaitFailed:
      return "WAIT_FAILED";
    case Fault::kPrivilegeRequired:
      return "PRIVILEGE_REQUIRED";
    case Fault::kFilterLoadFailed:
      return "FILTER_LOAD_FAILED";
    case Fault::kLimitSetFailed:
      return "LIMIT_SET_FAILED";
    case Fault::kIORedirectFailed:
      return "IO_REDIRECT_FAILED";
    case Fault::kPrivilegeDropFailed:
      return "PRIVILEGE_DROP_FAILED";
    case Fault::kExecFailed:
      return "EXEC_FAILED";
    case Fault::kExternalCheckerError:
      return "EXTERNAL_CHECKER_ERROR";
  }
  return "UNKNOWN";
}

RunResult Run(const RunConfig& config) { return Unix(config).Execute(); }

}  // namespace sandbox
