#ifndef SANDBOX_LIMITS_HPP
#define SANDBOX_LIMITS_HPP

#include <sys/resource.h>

#include "sandbox/sandbox.hpp"
#include "sandbox/setup_error.hpp"

namespace sandbox {

// Address space granted in strict memory mode, as a multiple of the memory
// limit. Virtual size overshoots resident size (loader, allocator arenas), and
// the limit itself is judged against the peak resident size.
static const constexpr int64_t kAddressSpaceFactor = 2;

// Resource limits derived from a RunConfig. Zero means "leave unset".
struct ResourceLimits {
  rlim_t cpu_seconds = 0;
  rlim_t address_space_bytes = 0;
  rlim_t stack_bytes = 0;
  rlim_t processes = 0;
  rlim_t file_size_bytes = 0;
};

// Computes the limits to apply. Runs in the parent.
ResourceLimits ComputeResourceLimits(const RunConfig& config);

// Applies CPU, address space, stack, process and core file limits to the
// calling process. Executed in the child before exec; does not allocate.
bool ApplyResourceLimits(const ResourceLimits& limits, SetupError* error);

// Applies the output size limit. Executed in the child before exec.
bool ApplyOutputLimit(const ResourceLimits& limits, SetupError* error);

}  // namespace sandbox

#endif
