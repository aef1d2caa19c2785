#include "sandbox/filter.hpp"

#include <errno.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>

#include "sandbox/seccomp_rules.hpp"
#include "util/error.hpp"

namespace {

using FilterContext = std::unique_ptr<void, decltype(&seccomp_release)>;

// Syscalls the child makes between installing the filter and exec.
bool AddEngineRules(const sandbox::RunConfig& config, sandbox::RuleSet* rules) {
  const scmp_datum_t uid = static_cast<scmp_datum_t>(config.uid);
  const scmp_datum_t gid = static_cast<scmp_datum_t>(config.gid);
  return rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(setgroups),
                    {SCMP_A0(SCMP_CMP_EQ, 1)}) &&
         rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(setresgid),
                    {SCMP_A0(SCMP_CMP_EQ, gid), SCMP_A1(SCMP_CMP_EQ, gid),
                     SCMP_A2(SCMP_CMP_EQ, gid)}) &&
         rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(setresuid),
                    {SCMP_A0(SCMP_CMP_EQ, uid), SCMP_A1(SCMP_CMP_EQ, uid),
                     SCMP_A2(SCMP_CMP_EQ, uid)}) &&
         rules->Allow(SCMP_SYS(getresuid)) &&
         rules->Allow(SCMP_SYS(getresgid)) && rules->Allow(SCMP_SYS(write)) &&
         rules->Allow(SCMP_SYS(exit_group));
}

// Only the configured executable may be exec'd.
bool RestrictExecve(const sandbox::RunConfig& config,
                    sandbox::RuleSet* rules) {
  const scmp_datum_t exe =
      reinterpret_cast<scmp_datum_t>(config.exe_path.c_str());
  if (rules->IsWhitelist()) {
    return rules->Add(SCMP_ACT_ALLOW, SCMP_SYS(execve),
                      {SCMP_A0(SCMP_CMP_EQ, exe)});
  }
  return rules->Add(SCMP_ACT_KILL_PROCESS, SCMP_SYS(execve),
                    {SCMP_A0(SCMP_CMP_NE, exe)});
}

bool ExportBpf(scmp_filter_ctx ctx, sandbox::FilterProgram* program,
               std::string* error_msg) {
  int fd = memfd_create("seccomp", MFD_CLOEXEC);
  if (fd == -1) {
    *error_msg = "memfd_create: " + util::StrError(errno);
    return false;
  }
  auto fail = [fd, error_msg](const char* what, int err) {
    *error_msg = std::string(what) + ": " + util::StrError(err);
    close(fd);
    return false;
  };
  int ret = seccomp_export_bpf(ctx, fd);
  if (ret != 0) return fail("seccomp_export_bpf", -ret);
  struct stat st {};
  if (fstat(fd, &st) == -1) return fail("fstat", errno);
  if (st.st_size == 0 || st.st_size % sizeof(struct sock_filter) != 0) {
    return fail("seccomp_export_bpf", EINVAL);
  }
  program->instructions.resize(st.st_size / sizeof(struct sock_filter));
  char* data = reinterpret_cast<char*>(program->instructions.data());
  off_t num_read = 0;
  while (num_read < st.st_size) {
    ssize_t cur = pread(fd, data + num_read, st.st_size - num_read, num_read);
    if (cur == -1 && errno == EINTR) continue;
    if (cur <= 0) return fail("pread", cur == 0 ? EIO : errno);
    num_read += cur;
  }
  close(fd);
  return true;
}

}  // namespace

namespace sandbox {

bool CompileFilter(const RunConfig& config, FilterProgram* program,
                   std::string* error_msg) {
  program->instructions.clear();
  if (!config.seccomp_rule_name) return true;
  const SeccompRules::Policy* policy =
      SeccompRules::Find(*config.seccomp_rule_name);
  if (policy == nullptr) {
    *error_msg = "unknown seccomp policy " + *config.seccomp_rule_name;
    return false;
  }
  FilterContext ctx(seccomp_init(policy->default_action), &seccomp_release);
  if (!ctx) {
    *error_msg = "seccomp_init failed";
    return false;
  }
  RuleSet rules(ctx.get(), policy->default_action);
  if (!policy->add_rules(&rules, config) ||
      (rules.IsWhitelist() && !AddEngineRules(config, &rules)) ||
      !RestrictExecve(config, &rules)) {
    *error_msg = "seccomp_rule_add (" + policy->name +
                 "): " + util::StrError(-rules.Error());
    return false;
  }
  return ExportBpf(ctx.get(), program, error_msg);
}

bool InstallFilter(const FilterProgram& program, SetupError* error) {
  if (program.empty()) return true;
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    return error->Set(Fault::kFilterLoadFailed, "prctl NO_NEW_PRIVS", errno);
  }
  struct sock_fprog prog {};
  prog.len = static_cast<unsigned short>(program.instructions.size());
  prog.filter = const_cast<struct sock_filter*>(program.instructions.data());
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) == -1) {
    return error->Set(Fault::kFilterLoadFailed, "prctl SET_SECCOMP", errno);
  }
  return true;
}

}  // namespace sandbox
