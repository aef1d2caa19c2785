#include "sandbox/redirect.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr int kOutputFlags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
const constexpr mode_t kOutputMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;

// dup2 onto the same descriptor keeps O_CLOEXEC, which would close the stream
// on exec.
bool Rebind(int fd, int target) {
  if (fd == target) {
    int flags = fcntl(fd, F_GETFD);
    return flags != -1 && fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) != -1;
  }
  return dup2(fd, target) != -1;
}

// Marks every descriptor above stderr close-on-exec, so that nothing the
// supervisor had open reaches the program.
bool CloseInheritedFds() {
  if (close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return true;
  if (errno != ENOSYS && errno != EINVAL) return false;
  struct rlimit rlim {};
  if (getrlimit(RLIMIT_NOFILE, &rlim) == -1) return false;
  for (rlim_t fd = 3; fd < rlim.rlim_cur; fd++) {
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) == -1 && errno != EBADF) return false;
  }
  return true;
}

}  // namespace

namespace sandbox {

bool RedirectStandardStreams(const RunConfig& config,
                             const ResourceLimits& limits, SetupError* error) {
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!config.input_path.empty()) {
    stdin_fd = open(config.input_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd == -1) {
      return error->Set(Fault::kIORedirectFailed, "open input", errno);
    }
  }
  if (!config.output_path.empty()) {
    stdout_fd = open(config.output_path.c_str(), kOutputFlags, kOutputMode);
    if (stdout_fd == -1) {
      return error->Set(Fault::kIORedirectFailed, "open output", errno);
    }
  }
  if (!config.error_path.empty()) {
    if (config.error_path == config.output_path) {
      stderr_fd = stdout_fd;
    } else {
      stderr_fd = open(config.error_path.c_str(), kOutputFlags, kOutputMode);
      if (stderr_fd == -1) {
        return error->Set(Fault::kIORedirectFailed, "open error", errno);
      }
    }
  }

#define REDIR(field, fd)                                                  \
  if (field##_fd != -1 && !Rebind(field##_fd, fd)) {                      \
    return error->Set(Fault::kIORedirectFailed, "redir " #field, errno); \
  }
  REDIR(stdin, STDIN_FILENO);
  REDIR(stdout, STDOUT_FILENO);
  REDIR(stderr, STDERR_FILENO);
#undef REDIR

  if (!CloseInheritedFds()) {
    return error->Set(Fault::kIORedirectFailed, "close fds", errno);
  }
  return ApplyOutputLimit(limits, error);
}

}  // namespace sandbox
