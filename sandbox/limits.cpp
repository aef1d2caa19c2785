#include "sandbox/limits.hpp"

#include <errno.h>

namespace sandbox {

ResourceLimits ComputeResourceLimits(const RunConfig& config) {
  ResourceLimits limits;
  if (config.max_cpu_time_millis != kUnlimited) {
    rlim_t millis = config.max_cpu_time_millis;
    limits.cpu_seconds = millis / 1000 + (millis % 1000 != 0);
  }
  if (config.max_memory_bytes != kUnlimited &&
      !config.memory_limit_check_only) {
    rlim_t bytes = config.max_memory_bytes;
    limits.address_space_bytes = bytes > RLIM_INFINITY / kAddressSpaceFactor
                                     ? RLIM_INFINITY
                                     : bytes * kAddressSpaceFactor;
  }
  limits.stack_bytes = config.max_stack_bytes;
  if (config.max_process_number != kUnlimited) {
    limits.processes = config.max_process_number;
  }
  if (config.max_output_size_bytes != kUnlimited) {
    limits.file_size_bytes = config.max_output_size_bytes;
  }
  return limits;
}

bool ApplyResourceLimits(const ResourceLimits& limits, SetupError* error) {
  struct rlimit rlim {};
#define SET_RLIM(res, cur, max)                                   \
  {                                                               \
    rlim.rlim_cur = cur;                                          \
    rlim.rlim_max = max;                                          \
    if (setrlimit(RLIMIT_##res, &rlim) < 0) {                     \
      return error->Set(Fault::kLimitSetFailed, "setrlimit " #res, \
                        errno);                                   \
    }                                                             \
  }

  // The hard limit is one second above the soft one: SIGXCPU is delivered
  // first, SIGKILL follows if the program ignores it.
  if (limits.cpu_seconds != 0) {
    SET_RLIM(CPU, limits.cpu_seconds, limits.cpu_seconds + 1);
  }
  if (limits.address_space_bytes != 0) {
    SET_RLIM(AS, limits.address_space_bytes, limits.address_space_bytes);
  }
  if (limits.stack_bytes != 0) {
    SET_RLIM(STACK, limits.stack_bytes, limits.stack_bytes);
  }
  if (limits.processes != 0) {
    SET_RLIM(NPROC, limits.processes, limits.processes);
  }
  SET_RLIM(CORE, 0, 0);
#undef SET_RLIM
  return true;
}

bool ApplyOutputLimit(const ResourceLimits& limits, SetupError* error) {
  if (limits.file_size_bytes == 0) return true;
  struct rlimit rlim {};
  rlim.rlim_cur = limits.file_size_bytes;
  rlim.rlim_max = limits.file_size_bytes;
  if (setrlimit(RLIMIT_FSIZE, &rlim) < 0) {
    return error->Set(Fault::kLimitSetFailed, "setrlimit FSIZE", errno);
  }
  return true;
}

}  // namespace sandbox
