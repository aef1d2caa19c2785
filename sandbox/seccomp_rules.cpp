#include "sandbox/seccomp_rules.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>

namespace sandbox {

bool RuleSet::Add(uint32_t action, int syscall,
                  std::initializer_list<scmp_arg_cmp> args) {
  if (args.size() == 0 &&
      !unconditional_.emplace(action, syscall).second) {
    return true;
  }
  int ret = seccomp_rule_add_array(ctx_, action, syscall, args.size(),
                                   args.size() ? args.begin() : nullptr);
  if (ret != 0) {
    error_ = ret;
    return false;
  }
  return true;
}

SeccompRules::store_t* SeccompRules::Policies_() {
  static store_t* policies = new store_t;
  return policies;
}

void SeccompRules::Register_(Policy policy) {
  Policies_()->push_back(std::move(policy));
}

const SeccompRules::Policy* SeccompRules::Find(const std::string& name) {
  for (const Policy& policy : *Policies_()) {
    if (policy.name == name) return &policy;
  }
  return nullptr;
}

std::vector<std::string> SeccompRules::Names() {
  std::vector<std::string> names;
  for (const Policy& policy : *Policies_()) names.push_back(policy.name);
  return names;
}

namespace {

// Enough for the dynamic loader, libc and libstdc++ startup, plain I/O on the
// standard streams, memory management and sleeping.
bool AddCCppBase(RuleSet* rules) {
  static const int kAllowed[] = {
      SCMP_SYS(access),          SCMP_SYS(arch_prctl),
      SCMP_SYS(brk),             SCMP_SYS(clock_gettime),
      SCMP_SYS(clock_nanosleep), SCMP_SYS(close),
      SCMP_SYS(exit),            SCMP_SYS(exit_group),
      SCMP_SYS(faccessat),       SCMP_SYS(fstat),
      SCMP_SYS(futex),           SCMP_SYS(getegid),
      SCMP_SYS(geteuid),         SCMP_SYS(getgid),
      SCMP_SYS(getpid),          SCMP_SYS(getuid),
      SCMP_SYS(getrandom),       SCMP_SYS(getrusage),
      SCMP_SYS(gettid),          SCMP_SYS(gettimeofday),
      SCMP_SYS(lseek),           SCMP_SYS(madvise),
      SCMP_SYS(mmap),            SCMP_SYS(mprotect),
      SCMP_SYS(mremap),          SCMP_SYS(munmap),
      SCMP_SYS(nanosleep),       SCMP_SYS(newfstatat),
      SCMP_SYS(pread64),         SCMP_SYS(prlimit64),
      SCMP_SYS(read),            SCMP_SYS(readlink),
      SCMP_SYS(readv),           SCMP_SYS(rseq),
      SCMP_SYS(rt_sigaction),    SCMP_SYS(rt_sigprocmask),
      SCMP_SYS(rt_sigreturn),    SCMP_SYS(sched_yield),
      SCMP_SYS(set_robust_list), SCMP_SYS(set_tid_address),
      SCMP_SYS(sigaltstack),     SCMP_SYS(statx),
      SCMP_SYS(sysinfo),         SCMP_SYS(time),
      SCMP_SYS(times),           SCMP_SYS(uname),
      SCMP_SYS(write),           SCMP_SYS(writev),
  };
  for (int nr : kAllowed) {
    if (!rules->Allow(nr)) return false;
  }
  // Terminal probing done by stdio when a stream is a character device.
  return rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(ioctl),
                    {SCMP_A1(SCMP_CMP_EQ, TCGETS)});
}

bool AllowReadOnlyOpen(RuleSet* rules) {
  return rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(open),
                    {SCMP_A1(SCMP_CMP_MASKED_EQ, O_WRONLY | O_RDWR, 0)}) &&
         rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(openat),
                    {SCMP_A2(SCMP_CMP_MASKED_EQ, O_WRONLY | O_RDWR, 0)});
}

class CCpp {
 public:
  static const char* Name() { return "c_cpp"; }
  static uint32_t DefaultAction() { return SCMP_ACT_KILL_PROCESS; }
  static bool AddRules(RuleSet* rules, const RunConfig& /*config*/) {
    return AddCCppBase(rules) && AllowReadOnlyOpen(rules);
  }
};

class CCppFileIO {
 public:
  static const char* Name() { return "c_cpp_file_io"; }
  static uint32_t DefaultAction() { return SCMP_ACT_KILL_PROCESS; }
  static bool AddRules(RuleSet* rules, const RunConfig& /*config*/) {
    if (!AddCCppBase(rules)) return false;
    for (int nr : {SCMP_SYS(open), SCMP_SYS(openat), SCMP_SYS(dup),
                   SCMP_SYS(dup2), SCMP_SYS(dup3)}) {
      if (!rules->Allow(nr)) return false;
    }
    return true;
  }
};

// Everything is allowed except creating processes, signalling other
// processes, networking and opening files for writing.
class General {
 public:
  static const char* Name() { return "general"; }
  static uint32_t DefaultAction() { return SCMP_ACT_ALLOW; }
  static bool AddRules(RuleSet* rules, const RunConfig& /*config*/) {
    static const int kForbidden[] = {
        SCMP_SYS(clone), SCMP_SYS(clone3),   SCMP_SYS(fork),
        SCMP_SYS(vfork), SCMP_SYS(kill),     SCMP_SYS(tkill),
        SCMP_SYS(socket), SCMP_SYS(execveat),
    };
    for (int nr : kForbidden) {
      if (!rules->Kill(nr)) return false;
    }
    for (int flag : {O_WRONLY, O_RDWR}) {
      scmp_datum_t mask = static_cast<scmp_datum_t>(flag);
      if (!rules->Add(SCMP_ACT_KILL_PROCESS, SCMP_SYS(open),
                      {SCMP_A1(SCMP_CMP_MASKED_EQ, mask, mask)}) ||
          !rules->Add(SCMP_ACT_KILL_PROCESS, SCMP_SYS(openat),
                      {SCMP_A2(SCMP_CMP_MASKED_EQ, mask, mask)})) {
        return false;
      }
    }
    return true;
  }
};

SeccompRules::Register<CCpp> c_cpp;                // NOLINT
SeccompRules::Register<CCppFileIO> c_cpp_file_io;  // NOLINT
SeccompRules::Register<General> general;           // NOLINT

}  // namespace

}  // namespace sandbox
