#include "sandbox/watchdog.hpp"

#include <errno.h>
#include <signal.h>

#include <system_error>

#include "absl/time/time.h"
#include "glog/logging.h"
#include "util/error.hpp"

namespace sandbox {

Watchdog::~Watchdog() { ChildExited(); }

bool Watchdog::Start(std::string* error_msg) {
  try {
    thread_ = std::thread(&Watchdog::Run, this);
  } catch (const std::system_error& e) {
    *error_msg = std::string("watchdog thread: ") + e.what();
    return false;
  }
  return true;
}

bool Watchdog::ChildExited() {
  {
    absl::MutexLock lock(&mutex_);
    exited_ = true;
  }
  if (thread_.joinable()) thread_.join();
  absl::MutexLock lock(&mutex_);
  return fired_;
}

void Watchdog::Run() {
  if (mutex_.LockWhenWithTimeout(absl::Condition(&exited_),
                                 absl::Milliseconds(limit_millis_))) {
    mutex_.Unlock();
    return;
  }
  // The child called setsid(), so its pid is also its process group id.
  // It is not reaped before exited_ is set, so the group still exists.
  // kill() also succeeds on a zombie, so fired_ does not mean the program was
  // still running.
  if (kill(-pid_, SIGKILL) == 0 || kill(pid_, SIGKILL) == 0) {
    fired_ = true;
  } else {
    // Nothing left to kill: the child won the race.
    LOG(WARNING) << "Watchdog could not kill " << pid_ << ": "
                 << util::StrError(errno);
  }
  mutex_.Unlock();
}

}  // namespace sandbox
