#include "sandbox/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <memory>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "sandbox/classifier.hpp"
#include "sandbox/redirect.hpp"
#include "sandbox/setup_error.hpp"
#include "sandbox/validation.hpp"
#include "sandbox/watchdog.hpp"
#include "util/error.hpp"

namespace {

int64_t CpuTimeMillis(const struct rusage& usage) {
  int64_t micros =
      (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000000LL +
      usage.ru_utime.tv_usec + usage.ru_stime.tv_usec;
  return micros / 1000;
}

std::string LimitToString(int64_t limit) {
  return limit == sandbox::kUnlimited ? "unlimited" : std::to_string(limit);
}

// Ignored signals and the signal mask are inherited across exec.
bool ResetSignals(sandbox::SetupError* error) {
  struct sigaction action {};
  action.sa_handler = SIG_DFL;
  for (int sig = 1; sig < NSIG; sig++) {
    if (sig == SIGKILL || sig == SIGSTOP) continue;
    // EINVAL for the real-time signals reserved by the C library.
    if (sigaction(sig, &action, nullptr) == -1 && errno != EINVAL) {
      return error->Set(sandbox::Fault::kForkFailed, "sigaction", errno);
    }
  }
  sigset_t mask;
  sigemptyset(&mask);
  if (sigprocmask(SIG_SETMASK, &mask, nullptr) == -1) {
    return error->Set(sandbox::Fault::kForkFailed, "sigprocmask", errno);
  }
  return true;
}

}  // namespace

namespace sandbox {

Unix::~Unix() {
  for (int fd : pipe_fds_) {
    if (fd != -1) close(fd);
  }
}

RunResult Unix::Execute() {
  RunResult result;
  result.fault = Prepare(&result.error_message);
  if (result.fault == Fault::kNone) {
    if (Setup(&result.error_message) && DoFork(&result.error_message)) {
      Wait(&result);
    } else {
      result.fault = Fault::kForkFailed;
    }
  }
  result.outcome = Classify(config_, result, killed_by_watchdog_);

  if (result.fault != Fault::kNone) {
    AUDIT(&audit_, ERROR) << FaultName(result.fault) << ": "
                          << result.error_message;
  }
  AUDIT(&audit_, INFO) << "Finished " << config_.exe_path << ": "
                       << OutcomeName(result.outcome)
                       << " cpu=" << result.cpu_time_millis
                       << "ms real=" << result.real_time_millis
                       << "ms memory=" << result.memory_bytes
                       << " signal=" << result.signal
                       << " exit_code=" << result.exit_code;
  return result;
}

Fault Unix::Prepare(std::string* error_msg) {
  if (!ValidateConfig(config_, error_msg)) return Fault::kInvalidConfig;
  if (!audit_.Open(config_.log_path)) {
    *error_msg = config_.log_path + ": cannot open log file";
    return Fault::kInvalidConfig;
  }
  if (!CheckPrivileges(config_, &identity_, error_msg)) {
    return Fault::kPrivilegeRequired;
  }

  AUDIT(&audit_, INFO) << "Running " << config_.exe_path << " ["
                       << absl::StrJoin(config_.args, " ") << "] as "
                       << config_.uid << ":" << config_.gid << " cpu="
                       << LimitToString(config_.max_cpu_time_millis)
                       << " real="
                       << LimitToString(config_.max_real_time_millis)
                       << " memory=" << LimitToString(config_.max_memory_bytes)
                       << (config_.memory_limit_check_only ? " (check only)"
                                                           : "")
                       << " processes="
                       << LimitToString(config_.max_process_number)
                       << " output="
                       << LimitToString(config_.max_output_size_bytes)
                       << " seccomp="
                       << config_.seccomp_rule_name.value_or("none");
  if (identity_.uid == 0) {
    AUDIT(&audit_, WARNING) << "The program will run as root";
  }

  limits_ = ComputeResourceLimits(config_);
  if (!CompileFilter(config_, &filter_, error_msg)) {
    return Fault::kFilterLoadFailed;
  }

  // Prepare argv and envp.
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(config_.exe_path);
  for (const std::string& arg : config_.args) add_arg(arg);
  for (const std::string& var : config_.env) add_arg(var);
  size_t nargs = config_.args.size() + 1;
  for (size_t i = 0; i < arg_storage_.size(); i++) {
    (i < nargs ? argv_ : envp_).push_back(arg_storage_[i].data());
  }
  argv_.push_back(nullptr);
  envp_.push_back(nullptr);
  return Fault::kNone;
}

bool Unix::Setup(std::string* error_msg) {
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: " + util::StrError(errno);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  pid_t fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: " + util::StrError(errno);
    return false;
  }
  if (fork_result != 0) {
    start_ = std::chrono::steady_clock::now();
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  SetupError error;
  auto die = [this, &error]() {
    // If the parent is gone there is nobody to tell.
    if (write(pipe_fds_[1], &error, sizeof(error)) == -1) _exit(2);
    _exit(1);
  };

  // Change session, so that we do not receive Ctrl-Cs in the terminal and
  // the whole process group can be killed at once.
  if (setsid() == -1) {
    error.Set(Fault::kForkFailed, "setsid", errno);
    die();
  }
  if (!ResetSignals(&error) || !ApplyResourceLimits(limits_, &error) ||
      !RedirectStandardStreams(config_, limits_, &error) ||
      !InstallFilter(filter_, &error) || !DropPrivileges(identity_, &error)) {
    die();
  }
  // The filter only allows this exact pointer.
  execve(config_.exe_path.c_str(), argv_.data(), envp_.data());
  error.Set(Fault::kExecFailed, "execve", errno);
  die();
  // [[noreturn]] does not work on lambdas...
  _exit(1);
}

void Unix::Wait(RunResult* result) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;

  auto fail = [result](Fault fault, const std::string& message) {
    if (result->fault != Fault::kNone) return;
    result->fault = fault;
    result->error_message = message;
  };

  std::unique_ptr<Watchdog> watchdog;
  if (config_.max_real_time_millis != kUnlimited) {
    watchdog =
        absl::make_unique<Watchdog>(child_pid_, config_.max_real_time_millis);
    std::string error_msg;
    if (!watchdog->Start(&error_msg)) {
      watchdog.reset();
      fail(Fault::kWatchdogFailed, error_msg);
      if (kill(child_pid_, SIGKILL) == -1) {
        LOG(ERROR) << "kill " << child_pid_ << ": " << util::StrError(errno);
      }
    }
  }

  // Blocks until exec succeeds (the pipe is closed on exec) or a setup step
  // fails.
  SetupError error;
  ssize_t num_read = 0;
  do {
    num_read = read(pipe_fds_[0], &error, sizeof(error));
  } while (num_read == -1 && errno == EINTR);
  close(pipe_fds_[0]);
  pipe_fds_[0] = -1;
  if (num_read == sizeof(error)) {
    fail(error.fault, absl::StrCat(error.step, ": ",
                                   util::StrError(error.error)));
  }

  // Wait without reaping, so that the pid stays valid until the watchdog is
  // disarmed.
  siginfo_t info {};
  int ret = 0;
  do {
    ret = waitid(P_PID, child_pid_, &info, WEXITED | WNOWAIT);
  } while (ret == -1 && errno == EINTR);
  if (ret == -1) {
    fail(Fault::kWaitFailed, "waitid: " + util::StrError(errno));
    if (kill(-child_pid_, SIGKILL) == -1 && kill(child_pid_, SIGKILL) == -1 &&
        errno != ESRCH) {
      LOG(ERROR) << "kill " << child_pid_ << ": " << util::StrError(errno);
    }
    if (watchdog) watchdog->ChildExited();
    // Still reap the child, without resource usage.
    pid_t reaped = 0;
    do {
      reaped = wait4(child_pid_, nullptr, 0, nullptr);
    } while (reaped == -1 && errno == EINTR);
    if (reaped == -1) {
      LOG(ERROR) << "wait4 " << child_pid_ << ": " << util::StrError(errno);
    }
    return;
  }
  // The watchdog may fire after the child exited but before it was reaped;
  // the status decides whether its kill did anything.
  bool watchdog_fired = watchdog && watchdog->ChildExited();

  // Processes the program left behind in its group.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    LOG(WARNING) << "kill " << -child_pid_ << ": " << util::StrError(errno);
  }

  int child_status = 0;
  struct rusage rusage {};
  pid_t reaped = 0;
  do {
    reaped = wait4(child_pid_, &child_status, 0, &rusage);
  } while (reaped == -1 && errno == EINTR);
  if (reaped != child_pid_) {
    fail(Fault::kWaitFailed, "wait4: " + util::StrError(errno));
    return;
  }
  killed_by_watchdog_ = watchdog_fired && WIFSIGNALED(child_status) &&
                        WTERMSIG(child_status) == SIGKILL;
  if (killed_by_watchdog_) {
    AUDIT(&audit_, WARNING) << "Wall time limit of "
                            << config_.max_real_time_millis
                            << "ms exceeded, killed " << child_pid_;
  }

  result->real_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start_)
          .count();
  result->cpu_time_millis = CpuTimeMillis(rusage);
  result->memory_bytes = rusage.ru_maxrss * 1024LL;
  result->exit_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  result->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
}

}  // namespace sandbox
