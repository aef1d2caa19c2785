#ifndef SANDBOX_WATCHDOG_HPP
#define SANDBOX_WATCHDOG_HPP

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace sandbox {

// Kills the process group of a child once a wall-clock deadline has passed,
// unless it is told first that the child exited. The owner must call
// ChildExited() while the child is still unreaped, so that a kill can never
// reach a recycled pid.
class Watchdog {
 public:
  Watchdog(pid_t pid, int64_t limit_millis)
      : pid_(pid), limit_millis_(limit_millis) {}
  ~Watchdog();

  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;
  Watchdog(Watchdog&&) = delete;
  Watchdog& operator=(Watchdog&&) = delete;

  // Starts the timer thread. Returns false and sets error_msg if the thread
  // cannot be created.
  bool Start(std::string* error_msg);

  // Disarms the watchdog and waits for its thread. Returns true if the
  // watchdog sent SIGKILL to the child before that.
  bool ChildExited();

 private:
  void Run();

  const pid_t pid_;
  const int64_t limit_millis_;
  absl::Mutex mutex_;
  bool exited_ GUARDED_BY(mutex_) = false;
  bool fired_ GUARDED_BY(mutex_) = false;
  std::thread thread_;
};

}  // namespace sandbox

#endif
