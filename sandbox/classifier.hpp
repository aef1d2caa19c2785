#ifndef SANDBOX_CLASSIFIER_HPP
#define SANDBOX_CLASSIFIER_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Computes the outcome of a run from the fault, termination status and
// measured usage stored in result. killed_by_watchdog tells whether the
// wall-time watchdog sent the kill.
//
// The checks are applied in this order, the first match wins:
//  - any fault: SystemError;
//  - SIGXCPU, or CPU time at or above the limit: CPUTimeLimitExceeded;
//  - SIGKILL from the watchdog, or wall time at or above the limit:
//    RealTimeLimitExceeded;
//  - peak memory at or above the limit: MemoryLimitExceeded;
//  - a signal or a non-zero exit code: RuntimeError;
//  - otherwise Success.
// A SIGKILL that could come from either the CPU hard limit or memory
// pressure is therefore attributed to CPU time only when the measured CPU
// time reached the limit.
Outcome Classify(const RunConfig& config, const RunResult& result,
                 bool killed_by_watchdog);

}  // namespace sandbox

#endif
