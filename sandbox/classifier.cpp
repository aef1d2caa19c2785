#include "sandbox/classifier.hpp"

#include <signal.h>

namespace {

bool Reached(int64_t value, int64_t limit) {
  return limit != sandbox::kUnlimited && value >= limit;
}

}  // namespace

namespace sandbox {

Outcome Classify(const RunConfig& config, const RunResult& result,
                 bool killed_by_watchdog) {
  if (result.fault != Fault::kNone) return Outcome::kSystemError;
  if (result.signal == SIGXCPU ||
      Reached(result.cpu_time_millis, config.max_cpu_time_millis)) {
    return Outcome::kCpuTimeLimitExceeded;
  }
  if ((killed_by_watchdog && result.signal == SIGKILL) ||
      Reached(result.real_time_millis, config.max_real_time_millis)) {
    return Outcome::kRealTimeLimitExceeded;
  }
  if (Reached(result.memory_bytes, config.max_memory_bytes)) {
    return Outcome::kMemoryLimitExceeded;
  }
  if (result.signal != 0 || result.exit_code != 0) {
    return Outcome::kRuntimeError;
  }
  return Outcome::kSuccess;
}

}  // namespace sandbox
