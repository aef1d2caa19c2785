#ifndef SANDBOX_SECCOMP_RULES_HPP
#define SANDBOX_SECCOMP_RULES_HPP

#include <seccomp.h>

#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Accumulates rules into a libseccomp context. Unconditional rules for the
// same syscall are added only once, so policies and the loader can both ask
// for a syscall without tripping over each other.
class RuleSet {
 public:
  RuleSet(scmp_filter_ctx ctx, uint32_t default_action)
      : ctx_(ctx), default_action_(default_action) {}

  bool IsWhitelist() const { return default_action_ != SCMP_ACT_ALLOW; }

  // Each returns false on error; Error() then holds the libseccomp code.
  bool Allow(int syscall) { return Add(SCMP_ACT_ALLOW, syscall, {}); }
  bool Kill(int syscall) {
    return Add(SCMP_ACT_KILL_PROCESS, syscall, {});
  }
  bool Add(uint32_t action, int syscall,
           std::initializer_list<scmp_arg_cmp> args);

  int Error() const { return error_; }

 private:
  scmp_filter_ctx ctx_;
  uint32_t default_action_;
  std::set<std::pair<uint32_t, int>> unconditional_;
  int error_ = 0;
};

// Catalog of named syscall policies. Policies register themselves by creating
// a global object of type SeccompRules::Register<Policy>; Policy must define
// the static members Name(), DefaultAction() and AddRules(RuleSet*, config).
// Registering is not thread-safe and must happen before any threads are
// created. The execve restriction is added by the loader, not by policies.
class SeccompRules {
 public:
  using add_rules_t = std::function<bool(RuleSet*, const RunConfig&)>;

  struct Policy {
    std::string name;
    uint32_t default_action;
    add_rules_t add_rules;
  };

  // Returns nullptr if no policy has the given name.
  static const Policy* Find(const std::string& name);
  static std::vector<std::string> Names();

  template <typename T>
  class Register {
   public:
    Register() {
      SeccompRules::Register_({T::Name(), T::DefaultAction(), &T::AddRules});
    }
  };

 private:
  using store_t = std::vector<Policy>;
  static store_t* Policies_();
  static void Register_(Policy policy);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
