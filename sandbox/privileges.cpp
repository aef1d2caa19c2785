#include "sandbox/privileges.hpp"

#include <errno.h>
#include <grp.h>
#include <unistd.h>

#include "absl/strings/str_cat.h"

namespace sandbox {

bool CheckPrivileges(const RunConfig& config, Identity* identity,
                     std::string* error_msg) {
  identity->uid = config.uid;
  identity->gid = config.gid;
  identity->reset_groups = geteuid() == 0;
  if (identity->reset_groups) return true;

  uid_t ruid = 0, euid = 0, suid = 0;
  gid_t rgid = 0, egid = 0, sgid = 0;
  if (getresuid(&ruid, &euid, &suid) == -1 ||
      getresgid(&rgid, &egid, &sgid) == -1) {
    *error_msg = "cannot read the current identity";
    return false;
  }
  if (ruid != config.uid || euid != config.uid || suid != config.uid ||
      rgid != config.gid || egid != config.gid || sgid != config.gid) {
    *error_msg = absl::StrCat("root is required to run as ", config.uid, ":",
                              config.gid, " (current identity ", euid, ":",
                              egid, ")");
    return false;
  }
  return true;
}

bool DropPrivileges(const Identity& identity, SetupError* error) {
  if (identity.reset_groups && setgroups(1, &identity.gid) == -1) {
    return error->Set(Fault::kPrivilegeDropFailed, "setgroups", errno);
  }
  if (setresgid(identity.gid, identity.gid, identity.gid) == -1) {
    return error->Set(Fault::kPrivilegeDropFailed, "setresgid", errno);
  }
  if (setresuid(identity.uid, identity.uid, identity.uid) == -1) {
    return error->Set(Fault::kPrivilegeDropFailed, "setresuid", errno);
  }

  uid_t ruid = 0, euid = 0, suid = 0;
  gid_t rgid = 0, egid = 0, sgid = 0;
  if (getresuid(&ruid, &euid, &suid) == -1 ||
      getresgid(&rgid, &egid, &sgid) == -1) {
    return error->Set(Fault::kPrivilegeDropFailed, "getresuid", errno);
  }
  if (ruid != identity.uid || euid != identity.uid || suid != identity.uid ||
      rgid != identity.gid || egid != identity.gid || sgid != identity.gid) {
    return error->Set(Fault::kPrivilegeDropFailed, "identity check", EPERM);
  }
  return true;
}

}  // namespace sandbox
