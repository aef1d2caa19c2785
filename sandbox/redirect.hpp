#ifndef SANDBOX_REDIRECT_HPP
#define SANDBOX_REDIRECT_HPP

#include "sandbox/limits.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/setup_error.hpp"

namespace sandbox {

// Rebinds stdin, stdout and stderr to the files named in the config, then
// applies the output size limit. Output files are created or truncated; when
// the output and error paths are the same, both streams share one file.
// Every other descriptor is marked close-on-exec.
// Executed in the child before exec; does not allocate.
bool RedirectStandardStreams(const RunConfig& config,
                             const ResourceLimits& limits, SetupError* error);

}  // namespace sandbox

#endif
