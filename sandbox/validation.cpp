#include "sandbox/validation.hpp"

#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "sandbox/seccomp_rules.hpp"
#include "util/error.hpp"

namespace {

bool CheckLimit(const char* name, int64_t value, std::string* error_msg) {
  if (value > 0 || value == sandbox::kUnlimited) return true;
  *error_msg = absl::StrCat("invalid ", name, ": ", value);
  return false;
}

bool UserExists(uid_t uid) {
  struct passwd pwd {};
  struct passwd* found = nullptr;
  long size = sysconf(_SC_GETPW_R_SIZE_MAX);
  std::vector<char> buf(size > 0 ? size : 16384);
  return getpwuid_r(uid, &pwd, buf.data(), buf.size(), &found) == 0 &&
         found != nullptr;
}

bool GroupExists(gid_t gid) {
  struct group grp {};
  struct group* found = nullptr;
  long size = sysconf(_SC_GETGR_R_SIZE_MAX);
  std::vector<char> buf(size > 0 ? size : 16384);
  return getgrgid_r(gid, &grp, buf.data(), buf.size(), &found) == 0 &&
         found != nullptr;
}

}  // namespace

namespace sandbox {

bool ValidateConfig(const RunConfig& config, std::string* error_msg) {
  if (config.exe_path.empty()) {
    *error_msg = "no executable given";
    return false;
  }
  struct stat st {};
  if (stat(config.exe_path.c_str(), &st) == -1) {
    *error_msg = config.exe_path + ": " + util::StrError(errno);
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    *error_msg = config.exe_path + ": not a regular file";
    return false;
  }

  if (!CheckLimit("max_cpu_time", config.max_cpu_time_millis, error_msg) ||
      !CheckLimit("max_real_time", config.max_real_time_millis, error_msg) ||
      !CheckLimit("max_memory", config.max_memory_bytes, error_msg) ||
      !CheckLimit("max_process_number", config.max_process_number,
                  error_msg) ||
      !CheckLimit("max_output_size", config.max_output_size_bytes,
                  error_msg)) {
    return false;
  }
  if (config.max_stack_bytes <= 0) {
    *error_msg = absl::StrCat("invalid max_stack: ", config.max_stack_bytes);
    return false;
  }

  if (config.args.size() > kMaxArgs) {
    *error_msg = absl::StrCat("too many arguments: ", config.args.size(),
                              " > ", kMaxArgs);
    return false;
  }
  if (config.env.size() > kMaxEnv) {
    *error_msg = absl::StrCat("too many environment variables: ",
                              config.env.size(), " > ", kMaxEnv);
    return false;
  }

  if (!UserExists(config.uid)) {
    *error_msg = absl::StrCat("unknown uid ", config.uid);
    return false;
  }
  if (!GroupExists(config.gid)) {
    *error_msg = absl::StrCat("unknown gid ", config.gid);
    return false;
  }

  if (config.seccomp_rule_name &&
      SeccompRules::Find(*config.seccomp_rule_name) == nullptr) {
    *error_msg = absl::StrCat("unknown seccomp policy \"",
                              *config.seccomp_rule_name, "\" (known: ",
                              absl::StrJoin(SeccompRules::Names(), ", "), ")");
    return false;
  }
  return true;
}

}  // namespace sandbox
