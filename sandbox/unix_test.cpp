#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <seccomp.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "absl/memory/memory.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;
using util::File;

using namespace sandbox;

std::string Program(const std::string& name) {
  return File::JoinPath(TEST_PROGRAMS_DIR, name);
}

// Runs as the current user, which needs no privileges.
RunConfig Config(const std::string& program,
                 std::vector<std::string> args = {}) {
  RunConfig config;
  config.exe_path = Program(program);
  config.args = std::move(args);
  config.uid = getuid();
  config.gid = getgid();
  return config;
}

const constexpr uid_t kNobody = 65534;

// Exit codes of the forked runs below.
const constexpr int kChildLeft = 100;
const constexpr int kSetupFailed = 101;

int ExitCode(Fault fault) { return -static_cast<int>(fault); }

// Whether pid is gone or only waits for its new parent to reap it. Polls for
// up to two seconds.
bool Exited(pid_t pid) {
  for (int i = 0; i < 200; i++) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) return true;
    // The state follows the command name, which is in parentheses.
    size_t pos = line.rfind(')');
    if (pos == std::string::npos || pos + 2 >= line.size()) return true;
    if (line[pos + 2] == 'Z' || line[pos + 2] == 'X') return true;
    usleep(10000);
  }
  return false;
}

// Runs config and exits with the code of the reported fault, or kChildLeft if
// the run left a child of the calling process behind. Meant for EXPECT_EXIT.
void ExitWithFault(const RunConfig& config) {
  RunResult result = Run(config);
  if (waitpid(-1, nullptr, WNOHANG) != -1 || errno != ECHILD) {
    _exit(kChildLeft);
  }
  _exit(ExitCode(result.fault));
}

struct FailingSyscall {
  int syscall;
  std::vector<scmp_arg_cmp> args;
};

// Like ExitWithFault, with the given syscalls failing with EPERM in this
// process and in the programs it starts.
void ExitWithFailingSyscalls(const RunConfig& config,
                             const std::vector<FailingSyscall>& failing) {
  scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
  if (ctx == nullptr) _exit(kSetupFailed);
  for (const FailingSyscall& rule : failing) {
    if (seccomp_rule_add_array(ctx, SCMP_ACT_ERRNO(EPERM), rule.syscall,
                               rule.args.size(), rule.args.data()) < 0) {
      _exit(kSetupFailed);
    }
  }
  if (seccomp_load(ctx) < 0) _exit(kSetupFailed);
  seccomp_release(ctx);
  ExitWithFault(config);
}

TEST(UnixTest, TestReturnZero) {
  RunResult result = Run(Config("return_arg1", {"0"}));
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.error_message, "");
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.signal, 0);
}

TEST(UnixTest, TestReturnArg1) {
  RunResult result = Run(Config("return_arg1", {"15"}));
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(result.exit_code, 15);
  EXPECT_EQ(result.signal, 0);
}

TEST(UnixTest, TestSignalArg1) {
  RunResult result = Run(Config("signal_arg1", {"6"}));
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(result.signal, 6);
  EXPECT_EQ(result.exit_code, 0);
}

TEST(UnixTest, TestWaitArg1) {
  RunConfig config = Config("wait_arg1", {"0.1"});
  config.max_real_time_millis = 5000;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_GE(result.real_time_millis, 90);
  EXPECT_LE(result.real_time_millis, 2000);
  EXPECT_LE(result.cpu_time_millis, 50);
}

TEST(UnixTest, TestCpuTimeLimit) {
  RunConfig config = Config("busywait_arg1", {"10"});
  config.max_cpu_time_millis = 500;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kCpuTimeLimitExceeded);
  EXPECT_GE(result.cpu_time_millis, 500);
  EXPECT_LT(result.cpu_time_millis, 5000);
  EXPECT_THAT(result.signal, ::testing::AnyOf(SIGXCPU, SIGKILL));
}

TEST(UnixTest, TestRealTimeLimit) {
  RunConfig config = Config("wait_arg1", {"5"});
  config.max_real_time_millis = 300;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kRealTimeLimitExceeded);
  EXPECT_EQ(result.signal, SIGKILL);
  EXPECT_GE(result.real_time_millis, 300);
  EXPECT_LT(result.real_time_millis, 5000);
}

TEST(UnixTest, TestRealTimeLimitNotReached) {
  RunConfig config = Config("return_arg1", {"0"});
  config.max_real_time_millis = 10000;
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_LT(result.real_time_millis, 10000);
}

TEST(UnixTest, TestMemoryLimit) {
  RunConfig config = Config("malloc_arg1", {"200"});
  config.max_memory_bytes = 64 * 1024 * 1024;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kMemoryLimitExceeded);
  EXPECT_GE(result.memory_bytes, config.max_memory_bytes);
}

TEST(UnixTest, TestMemoryLimitCheckOnly) {
  RunConfig config = Config("malloc_arg1", {"200"});
  config.max_memory_bytes = 64 * 1024 * 1024;
  config.memory_limit_check_only = true;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kMemoryLimitExceeded);
  // Nothing stopped the allocations.
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_GE(result.memory_bytes, 200 * 1024 * 1024);
}

TEST(UnixTest, TestMemoryWithinLimit) {
  RunConfig config = Config("malloc_arg1", {"10"});
  config.max_memory_bytes = 256 * 1024 * 1024;
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_GE(result.memory_bytes, 10 * 1024 * 1024);
  EXPECT_LT(result.memory_bytes, config.max_memory_bytes);
}

TEST(UnixTest, TestSeccompAllowsPlainProgram) {
  RunConfig config = Config("return_arg1", {"0"});
  config.seccomp_rule_name = "c_cpp";
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.error_message, "");
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
}

TEST(UnixTest, TestSeccompKillsFork) {
  RunConfig config = Config("fork_arg1", {"1"});
  config.seccomp_rule_name = "c_cpp";
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(result.signal, SIGSYS);
}

TEST(UnixTest, TestGeneralKillsFork) {
  RunConfig config = Config("fork_arg1", {"1"});
  config.seccomp_rule_name = "general";
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(result.signal, SIGSYS);
}

TEST(UnixTest, TestGeneralKillsWritableOpen) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config =
      Config("open_write_arg1", {File::JoinPath(tmp.Path(), "out")});
  config.seccomp_rule_name = "general";
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(result.signal, SIGSYS);
  EXPECT_LT(File::Size(File::JoinPath(tmp.Path(), "out")), 0);
}

TEST(UnixTest, TestFileIOAllowsWritableOpen) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config =
      Config("open_write_arg1", {File::JoinPath(tmp.Path(), "out")});
  config.seccomp_rule_name = "c_cpp_file_io";
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(File::Size(File::JoinPath(tmp.Path(), "out")), 0);
}

TEST(UnixTest, TestSeccompWithRedirectedOutput) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("print_arg1", {"10000"});
  config.output_path = File::JoinPath(tmp.Path(), "stdout");
  config.seccomp_rule_name = "c_cpp";
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(File::Size(config.output_path), 10000);
}

TEST(UnixTest, TestNoFile) {
  RunResult result = Run(Config("does_not_exist"));
  EXPECT_EQ(result.fault, Fault::kInvalidConfig);
  EXPECT_EQ(result.outcome, Outcome::kSystemError);
  EXPECT_THAT(result.error_message, HasSubstr("does_not_exist"));
}

TEST(UnixTest, TestNotExecutable) {
  util::TempDir tmp(::testing::TempDir());
  std::string path = File::JoinPath(tmp.Path(), "data");
  File::Write(path, "not a program\n", 0644);
  RunConfig config = Config("return_arg1");
  config.exe_path = path;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kExecFailed);
  EXPECT_EQ(result.outcome, Outcome::kSystemError);
  EXPECT_THAT(result.error_message, StartsWith("execve:"));
}

TEST(UnixTest, TestTooManyArgs) {
  RunConfig config =
      Config("return_arg1", std::vector<std::string>(kMaxArgs + 1, "0"));
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kInvalidConfig);
  EXPECT_THAT(result.error_message, HasSubstr("too many arguments"));
}

TEST(UnixTest, TestMaxArgs) {
  RunConfig config =
      Config("return_arg1", std::vector<std::string>(kMaxArgs, "0"));
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
}

TEST(UnixTest, TestTooManyEnv) {
  RunConfig config = Config("return_arg1", {"0"});
  config.env.assign(kMaxEnv + 1, "A=B");
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kInvalidConfig);
}

TEST(UnixTest, TestUnknownPolicy) {
  RunConfig config = Config("return_arg1", {"0"});
  config.seccomp_rule_name = "no_such_policy";
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kInvalidConfig);
  EXPECT_THAT(result.error_message, HasSubstr("no_such_policy"));
}

TEST(UnixTest, TestMissingInput) {
  RunConfig config = Config("cat_stdin");
  config.input_path = "/nonexistent/input.txt";
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kIORedirectFailed);
  EXPECT_EQ(result.outcome, Outcome::kSystemError);
  EXPECT_THAT(result.error_message, StartsWith("open input:"));
}

TEST(UnixTest, TestRedirection) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("cat_stdin");
  config.input_path = File::JoinPath(tmp.Path(), "input");
  config.output_path = File::JoinPath(tmp.Path(), "output");
  File::Write(config.input_path, "3 4\nsome input\n");
  File::Write(config.output_path, "previous contents that are longer\n");
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(File::Read(config.output_path), "3 4\nsome input\n");
}

TEST(UnixTest, TestSharedOutputAndError) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("signal_arg1", {"6"});
  config.output_path = File::JoinPath(tmp.Path(), "output");
  config.error_path = config.output_path;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(File::Size(config.output_path), 0);
}

TEST(UnixTest, TestArgsAndEnv) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("print_env", {"first", "second arg"});
  config.env = {"FOO=bar", "EMPTY="};
  config.output_path = File::JoinPath(tmp.Path(), "output");
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(File::Read(config.output_path),
            config.exe_path + "\nfirst\nsecond arg\nFOO=bar\nEMPTY=\n");
}

TEST(UnixTest, TestOutputLimit) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("print_arg1", {"100000"});
  config.output_path = File::JoinPath(tmp.Path(), "output");
  config.max_output_size_bytes = 1000;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(result.signal, SIGXFSZ);
  EXPECT_LE(File::Size(config.output_path), 1000);
}

TEST(UnixTest, TestAuditLog) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("return_arg1", {"0"});
  config.log_path = File::JoinPath(tmp.Path(), "run.log");
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  std::string log = File::Read(config.log_path);
  EXPECT_THAT(log, HasSubstr("Running " + config.exe_path));
  EXPECT_THAT(log, HasSubstr("SUCCESS"));

  // Appends.
  config.args = {"3"};
  Run(config);
  log = File::Read(config.log_path);
  EXPECT_THAT(log, HasSubstr("SUCCESS"));
  EXPECT_THAT(log, HasSubstr("RUNTIME_ERROR"));
}

TEST(UnixTest, TestUnopenableAuditLog) {
  RunConfig config = Config("return_arg1", {"0"});
  config.log_path = "/nonexistent/dir/run.log";
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kInvalidConfig);
}

TEST(UnixTest, TestConcurrentRuns) {
  util::TempDir tmp(::testing::TempDir());
  const int kRuns = 4;
  std::vector<RunResult> results(kRuns);
  std::vector<RunConfig> configs;
  for (int i = 0; i < kRuns; i++) {
    configs.push_back(Config("print_arg1", {std::to_string(1000 * (i + 1))}));
    configs.back().output_path =
        File::JoinPath(tmp.Path(), "out" + std::to_string(i));
    configs.back().max_real_time_millis = 10000;
  }
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; i++) {
    threads.emplace_back(
        [&results, &configs, i]() { results[i] = Run(configs[i]); });
  }
  for (std::thread& thread : threads) thread.join();
  for (int i = 0; i < kRuns; i++) {
    EXPECT_EQ(results[i].outcome, Outcome::kSuccess);
    EXPECT_EQ(File::Size(configs[i].output_path), 1000 * (i + 1));
  }
}

TEST(UnixTest, TestRepeatable) {
  RunConfig config = Config("signal_arg1", {"11"});
  RunResult first = Run(config);
  RunResult second = Run(config);
  EXPECT_EQ(first.outcome, Outcome::kRuntimeError);
  EXPECT_EQ(first.outcome, second.outcome);
  EXPECT_EQ(first.signal, second.signal);
}

TEST(UnixTest, TestOnlyStandardStreamsInherited) {
  util::TempDir tmp(::testing::TempDir());
  // Not close-on-exec, like descriptors an embedding program may hold.
  int extra_fd = open("/dev/null", O_RDONLY);
  ASSERT_NE(extra_fd, -1);
  RunConfig config = Config("list_fds");
  config.input_path = "/dev/null";
  config.output_path = File::JoinPath(tmp.Path(), "output");
  config.error_path = File::JoinPath(tmp.Path(), "error");
  config.log_path = File::JoinPath(tmp.Path(), "run.log");
  RunResult result = Run(config);
  close(extra_fd);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(File::Read(config.output_path), "0\n1\n2\n");
}

TEST(UnixTest, TestRealTimeLimitKillsGroup) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("spawn_sleep_arg1", {"30"});
  config.max_real_time_millis = 500;
  config.output_path = File::JoinPath(tmp.Path(), "output");
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kRealTimeLimitExceeded);

  pid_t pid = 0;
  pid_t grandchild = 0;
  std::istringstream(File::Read(config.output_path)) >> pid >> grandchild;
  ASSERT_GT(pid, 0);
  ASSERT_GT(grandchild, 0);
  // Killed and reaped before Run() returned.
  EXPECT_EQ(kill(pid, 0), -1);
  EXPECT_EQ(errno, ESRCH);
  EXPECT_TRUE(Exited(grandchild));
}

// Programs exiting right at the deadline may be found dead by the watchdog.
// That is neither a fault nor a wall time kill.
TEST(UnixTest, TestRealTimeLimitRace) {
  util::TempDir tmp(::testing::TempDir());
  for (int i = 0; i < 10; i++) {
    RunConfig config = Config("wait_arg1", {"0.295"});
    config.max_real_time_millis = 300;
    config.log_path = File::JoinPath(tmp.Path(), std::to_string(i) + ".log");
    RunResult result = Run(config);
    EXPECT_EQ(result.fault, Fault::kNone);
    if (result.signal != 0) {
      EXPECT_EQ(result.signal, SIGKILL);
      EXPECT_EQ(result.outcome, Outcome::kRealTimeLimitExceeded);
      continue;
    }
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.outcome, result.real_time_millis >= 300
                                  ? Outcome::kRealTimeLimitExceeded
                                  : Outcome::kSuccess);
    EXPECT_THAT(File::Read(config.log_path),
                ::testing::Not(HasSubstr("Wall time limit")));
  }
}

TEST(UnixTest, TestWallTimeKillAudited) {
  util::TempDir tmp(::testing::TempDir());
  RunConfig config = Config("wait_arg1", {"5"});
  config.max_real_time_millis = 200;
  config.log_path = File::JoinPath(tmp.Path(), "run.log");
  RunResult result = Run(config);
  EXPECT_EQ(result.outcome, Outcome::kRealTimeLimitExceeded);
  EXPECT_THAT(File::Read(config.log_path),
              HasSubstr("Wall time limit of 200ms exceeded"));
}

TEST(UnixDeathTest, TestLimitSetFailed) {
  RunConfig config = Config("return_arg1", {"0"});
  // glibc implements setrlimit with prlimit64; getrlimit passes no new limit.
  std::vector<FailingSyscall> failing = {
      {SCMP_SYS(setrlimit), {}},
      {SCMP_SYS(prlimit64), {SCMP_A2(SCMP_CMP_NE, 0)}},
  };
  EXPECT_EXIT(ExitWithFailingSyscalls(config, failing),
              ::testing::ExitedWithCode(ExitCode(Fault::kLimitSetFailed)),
              "");
}

TEST(UnixDeathTest, TestFilterLoadFailed) {
  RunConfig config = Config("return_arg1", {"0"});
  config.seccomp_rule_name = "c_cpp";
  std::vector<FailingSyscall> failing = {
      {SCMP_SYS(prctl), {SCMP_A0(SCMP_CMP_EQ, PR_SET_SECCOMP)}},
  };
  EXPECT_EXIT(ExitWithFailingSyscalls(config, failing),
              ::testing::ExitedWithCode(ExitCode(Fault::kFilterLoadFailed)),
              "");
}

TEST(UnixDeathTest, TestPrivilegeDropFailed) {
  RunConfig config = Config("return_arg1", {"0"});
  std::vector<FailingSyscall> failing = {{SCMP_SYS(setresgid), {}}};
  EXPECT_EXIT(
      ExitWithFailingSyscalls(config, failing),
      ::testing::ExitedWithCode(ExitCode(Fault::kPrivilegeDropFailed)), "");
}

TEST(UnixDeathTest, TestWaitFailedReapsChild) {
  RunConfig config = Config("return_arg1", {"0"});
  std::vector<FailingSyscall> failing = {{SCMP_SYS(waitid), {}}};
  EXPECT_EXIT(ExitWithFailingSyscalls(config, failing),
              ::testing::ExitedWithCode(ExitCode(Fault::kWaitFailed)), "");
}

TEST(UnixDeathTest, TestPrivilegeRequired) {
  // The program must be reachable by the unprivileged user.
  util::TempDir tmp("/tmp");
  ASSERT_EQ(chmod(tmp.Path().c_str(), 0755), 0);
  RunConfig config;
  config.exe_path = File::JoinPath(tmp.Path(), "return_arg1");
  File::Copy(Program("return_arg1"), config.exe_path, 0755);
  config.args = {"0"};
  config.uid = 0;
  config.gid = 0;
  if (geteuid() != 0) {
    RunResult result = Run(config);
    EXPECT_EQ(result.fault, Fault::kPrivilegeRequired);
    EXPECT_EQ(result.outcome, Outcome::kSystemError);
    return;
  }
  // As root, switch to nobody in a forked copy first.
  EXPECT_EXIT(
      {
        if (setgroups(0, nullptr) == -1 ||
            setresgid(kNobody, kNobody, kNobody) == -1 ||
            setresuid(kNobody, kNobody, kNobody) == -1) {
          _exit(kSetupFailed);
        }
        ExitWithFault(config);
      },
      ::testing::ExitedWithCode(ExitCode(Fault::kPrivilegeRequired)), "");
}

// The program is copied to a directory that the target user can reach.
class UnixRootTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (geteuid() != 0) GTEST_SKIP() << "needs to run as root";
    tmp_ = absl::make_unique<util::TempDir>("/tmp");
    ASSERT_EQ(chmod(tmp_->Path().c_str(), 0755), 0);
  }

  RunConfig NobodyConfig(const std::string& program,
                         std::vector<std::string> args = {}) {
    RunConfig config;
    config.exe_path = File::JoinPath(tmp_->Path(), program);
    File::Copy(Program(program), config.exe_path, 0755);
    config.args = std::move(args);
    config.output_path = File::JoinPath(tmp_->Path(), "output");
    return config;
  }

  std::unique_ptr<util::TempDir> tmp_;
};

TEST_F(UnixRootTest, TestDropPrivileges) {
  RunConfig config = NobodyConfig("print_ids");
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.outcome, Outcome::kSuccess);
  EXPECT_EQ(File::Read(config.output_path), "65534 65534\n");
}

TEST_F(UnixRootTest, TestDropPrivilegesWithSeccomp) {
  RunConfig config = NobodyConfig("print_ids");
  config.seccomp_rule_name = "c_cpp";
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  EXPECT_EQ(result.error_message, "");
  EXPECT_EQ(File::Read(config.output_path), "65534 65534\n");
}

TEST_F(UnixRootTest, TestProcessLimit) {
  RunConfig config = NobodyConfig("fork_arg1", {"5"});
  config.max_process_number = 2;
  RunResult result = Run(config);
  EXPECT_EQ(result.fault, Fault::kNone);
  // At most one fork can succeed.
  EXPECT_GE(result.exit_code, 4);
}

}  // namespace
