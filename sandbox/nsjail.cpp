#include "sandbox/nsjail.hpp"

#include <sys/wait.h>
#include <csignal>
#include <regex>
#include <sstream>

#include "util/flags.hpp"
#include "util/which.hpp"

namespace sandbox {
namespace {

// nsjail exits with 128+signal when the jailed process is killed by a signal.
const constexpr int kSignalExitBase = 128;
// ...and with 255 when it could not start the jail.
const constexpr int kInternalFailureExit = 255;

// Log lines look like "[I][2019-01-01T00:00:00+0000] message".
bool IsLogLevel(const std::string& line, char level) {
  return line.size() > 3 && line[0] == '[' && line[1] == level &&
         line[2] == ']';
}

std::string StripLogPrefix(const std::string& line) {
  size_t pos = line.find("] ", 3);
  if (pos == std::string::npos) return line;
  return line.substr(pos + 2);
}

}  // namespace

int NsJail::Score() { return util::which(Flags::nsjail).empty() ? -1 : 10; }

std::vector<std::string> NsJail::Command(const IsolationConfig& config) const {
  std::vector<std::string> argv = {util::which(Flags::nsjail)};
  auto add = [&argv](const char* name, const std::string& value) {
    argv.emplace_back(name);
    argv.push_back(value);
  };
  if (!Flags::nsjail_config.empty()) add("--config", Flags::nsjail_config);
  add("--mode", "o");
  add("--log_fd", std::to_string(kReportFd));
  add("--chroot", "/");
  add("--bindmount", config.scratch_dir + ":" + kSandboxMountPoint);
  add("--cwd", kSandboxMountPoint);
  // The wall clock is enforced by the supervisor.
  add("--time_limit", "0");
  add("--rlimit_cpu", config.cpu_limit_millis
                          ? std::to_string((config.cpu_limit_millis + 999) /
                                           1000)
                          : "inf");
  add("--rlimit_fsize",
      config.max_file_size_bytes
          ? std::to_string((config.max_file_size_bytes + (1 << 20) - 1) >> 20)
          : "inf");
  add("--rlimit_nofile",
      config.max_files ? std::to_string(config.max_files) : "inf");
  add("--rlimit_as", "inf");
  add("--rlimit_core", "0");
  if (config.memory_limit_bytes) {
    add("--cgroup_mem_max", std::to_string(config.memory_limit_bytes));
  }
  if (config.max_procs) {
    add("--cgroup_pids_max", std::to_string(config.max_procs));
  }
  if (config.allow_network) argv.emplace_back("--disable_clone_newnet");
  if (!Flags::seccomp_policy.empty()) {
    add("--seccomp_policy", Flags::seccomp_policy);
  }
  for (const std::string& var : config.env) add("--env", var);
  argv.emplace_back("--");
  argv.insert(argv.end(), config.command.begin(), config.command.end());
  return argv;
}

Termination NsJail::Interpret(int wait_status, const std::string& report,
                              const IsolationConfig& config) const {
  Termination termination;
  std::vector<std::string> errors;
  int reported_signal = 0;
  int stop_signal = 0;
  static const std::regex signal_re(R"(terminated with signal: .*\((\d+)\))");
  static const std::regex stop_re(R"(stopped because of signal: (\d+))");

  std::istringstream lines(report);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty()) continue;
    termination.log.push_back(line);
    if (IsLogLevel(line, 'E') || IsLogLevel(line, 'F')) {
      errors.push_back(StripLogPrefix(line));
    }
    std::smatch match;
    if (std::regex_search(line, match, signal_re)) {
      reported_signal = std::stoi(match[1]);
    }
    if (std::regex_search(line, match, stop_re)) {
      stop_signal = std::stoi(match[1]);
    }
  }

  if (WIFSIGNALED(wait_status)) {
    termination.kind = Termination::Kind::SIGNALED;
    termination.signal = WTERMSIG(wait_status);
    termination.message = "nsjail killed";
    return termination;
  }
  int code = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;

  if (code == kInternalFailureExit && !errors.empty()) {
    termination.kind = Termination::Kind::SETUP_FAILED;
    for (const std::string& error : errors) {
      if (!termination.message.empty()) termination.message += "; ";
      termination.message += error;
    }
    return termination;
  }

  // nsjail itself was signaled and SIGKILLed the jail on its way out: the
  // program died of that, not of a limit.
  if (stop_signal != 0) {
    termination.kind = Termination::Kind::SIGNALED;
    termination.signal = stop_signal;
    termination.message = "nsjail stopped";
    return termination;
  }

  int signal = reported_signal;
  if (signal == 0 && code > kSignalExitBase && code < kSignalExitBase + 65) {
    signal = code - kSignalExitBase;
  }
  if (signal == 0) {
    termination.kind = Termination::Kind::EXITED;
    termination.status_code = code;
    return termination;
  }

  termination.kind = Termination::Kind::SIGNALED;
  termination.signal = signal;
  if (signal == SIGXCPU) {
    termination.resource = Resource::CPU_TIME;
  } else if (signal == SIGXFSZ) {
    termination.resource = Resource::FILE_SIZE;
  } else if (signal == SIGKILL && config.memory_limit_bytes != 0) {
    // Within the jail, only the cgroup OOM killer sends SIGKILL unprompted.
    termination.resource = Resource::MEMORY;
  }
  if (termination.resource != Resource::NONE) {
    termination.kind = Termination::Kind::LIMIT_EXCEEDED;
  }
  return termination;
}

namespace {
Sandbox::Register<NsJail> r;  // NOLINT
}  // namespace

}  // namespace sandbox
