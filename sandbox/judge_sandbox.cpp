#include <iostream>
#include <string>
#include <vector>

#include "absl/strings/str_split.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox.hpp"

DEFINE_int64(max_cpu_time, sandbox::kUnlimited,
             "CPU time limit in milliseconds, -1 for no limit");  // NOLINT
DEFINE_int64(max_real_time, sandbox::kUnlimited,
             "wall time limit in milliseconds, -1 for no limit");  // NOLINT
DEFINE_int64(max_memory, sandbox::kUnlimited,
             "memory limit in bytes, -1 for no limit");  // NOLINT
DEFINE_int64(max_stack, 16 * 1024 * 1024, "stack size in bytes");  // NOLINT
DEFINE_int64(max_process_number, sandbox::kUnlimited,
             "maximum number of processes of the user, -1 for no limit");
DEFINE_int64(max_output_size, sandbox::kUnlimited,
             "maximum size of a written file in bytes, -1 for no limit");
DEFINE_bool(memory_limit_check_only, false,
            "only compare the peak memory usage against --max_memory");
DEFINE_string(exe_path, "", "program to run");  // NOLINT
DEFINE_string(input_path, "", "file to use as stdin");  // NOLINT
DEFINE_string(output_path, "", "file to use as stdout");  // NOLINT
DEFINE_string(error_path, "", "file to use as stderr");  // NOLINT
DEFINE_string(args, "", "comma separated arguments of the program");
DEFINE_string(env, "", "comma separated environment of the program");
DEFINE_string(log_path, "", "where to append the log of the run");  // NOLINT
DEFINE_string(seccomp_rule_name, "",
              "syscall policy to apply, empty for none");  // NOLINT
DEFINE_int32(uid, 65534, "user to run the program as");  // NOLINT
DEFINE_int32(gid, 65534, "group to run the program as");  // NOLINT

namespace {

std::vector<std::string> SplitList(const std::string& list) {
  return absl::StrSplit(list, ',', absl::SkipEmpty());
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "judge_sandbox [flags] [-- program arguments...]\n"
      "Runs a program under the given limits and prints the result as JSON");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  sandbox::RunConfig config;
  config.max_cpu_time_millis = FLAGS_max_cpu_time;
  config.max_real_time_millis = FLAGS_max_real_time;
  config.max_memory_bytes = FLAGS_max_memory;
  config.max_stack_bytes = FLAGS_max_stack;
  config.max_process_number = FLAGS_max_process_number;
  config.max_output_size_bytes = FLAGS_max_output_size;
  config.memory_limit_check_only = FLAGS_memory_limit_check_only;
  config.exe_path = FLAGS_exe_path;
  config.input_path = FLAGS_input_path;
  config.output_path = FLAGS_output_path;
  config.error_path = FLAGS_error_path;
  config.args = SplitList(FLAGS_args);
  for (int i = 1; i < argc; i++) config.args.emplace_back(argv[i]);
  config.env = SplitList(FLAGS_env);
  config.log_path = FLAGS_log_path;
  if (!FLAGS_seccomp_rule_name.empty()) {
    config.seccomp_rule_name = FLAGS_seccomp_rule_name;
  }
  config.uid = FLAGS_uid;
  config.gid = FLAGS_gid;

  sandbox::RunResult result = sandbox::Run(config);
  if (result.fault != sandbox::Fault::kNone) {
    LOG(ERROR) << sandbox::FaultName(result.fault) << ": "
               << result.error_message;
  }

  nlohmann::json json = {
      {"cpu_time", result.cpu_time_millis},
      {"real_time", result.real_time_millis},
      {"memory", result.memory_bytes},
      {"signal", result.signal},
      {"exit_code", result.exit_code},
      {"result", sandbox::OutcomeName(result.outcome)},
      {"error", sandbox::FaultName(result.fault)},
      {"error_message", result.error_message},
  };
  std::cout << json.dump(2) << std::endl;
  return result.fault == sandbox::Fault::kNone ? 0 : 1;
}
