#include "sandbox/unix.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sched.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <thread>

#include <capnp/serialize.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "util/flags.hpp"
#include "whereami++.h"

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

// Resident set size of pid, in KiB. Returns -1 if the process is gone.
int64_t GetProcessMemoryUsageKb(pid_t pid) {
  static const int64_t page_kb = sysconf(_SC_PAGESIZE) / 1024;
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/statm", pid);  // NOLINT
  kj::AutoCloseFd fd(open(path, O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) return -1;
  char buf[256] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);  // NOLINT
  if (num_read <= 0) return -1;
  int64_t size = 0;
  int64_t resident = 0;
  if (sscanf(buf, "%" SCNd64 " %" SCNd64, &size, &resident) != 2) {  // NOLINT
    return -1;
  }
  return resident * page_kb;
}

// Process group of pid, -1 if the process is gone.
pid_t GetProcessGroup(pid_t pid) {
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/stat", pid);  // NOLINT
  kj::AutoCloseFd fd(open(path, O_RDONLY | O_CLOEXEC));
  if (fd.get() == -1) return -1;
  char buf[1024] = {};
  ssize_t num_read = read(fd, buf, sizeof(buf) - 1);  // NOLINT
  if (num_read <= 0) return -1;
  // The command name may contain anything, the fields resume after the last
  // parenthesis.
  const char* fields = strrchr(buf, ')');
  if (fields == nullptr) return -1;
  char state = 0;
  int ppid = 0;
  int pgrp = 0;
  if (sscanf(fields + 1, " %c %d %d", &state, &ppid, &pgrp) != 3) {  // NOLINT
    return -1;
  }
  return pgrp;
}

// The processes of group pgrp other than the calling one, together with
// their total resident set size in KiB.
int64_t GetGroupMemoryUsageKb(pid_t pgrp, std::vector<pid_t>* members) {
  members->clear();
  std::unique_ptr<DIR, decltype(&closedir)> proc(opendir("/proc"), closedir);
  if (!proc) return -1;
  pid_t self = getpid();
  int64_t total = 0;
  while (struct dirent* entry = readdir(proc.get())) {  // NOLINT
    char* end = nullptr;
    long pid = strtol(entry->d_name, &end, 10);
    if (*end != '\0' || pid <= 0 || pid == self) continue;
    if (GetProcessGroup(pid) != pgrp) continue;
    int64_t mem = GetProcessMemoryUsageKb(pid);
    if (mem < 0) continue;
    total += mem;
    members->push_back(pid);
  }
  return total;
}

std::vector<char*> CStrings(std::vector<std::string>* strings) {
  std::vector<char*> ret;
  for (std::string& s : *strings) ret.push_back(&s[0]);
  ret.push_back(nullptr);
  return ret;
}

// Executed in the forked child, never returns. Errors are written on error_fd
// so that the parent can report them as a setup failure.
[[noreturn]] void Child(const sandbox::IsolationConfig& config, char** argv,
                        char** envp, int error_fd, bool own_group) {
  auto die2 = [error_fd](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(error_fd, buf, len) != len) _Exit(2);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // The sandbox ignores SIGTERM so that it can always report, the program
  // must not inherit that.
  if (signal(SIGTERM, SIG_DFL) == SIG_ERR) die("signal", errno);

  if (own_group && setpgid(0, 0) == -1) die("setpgid", errno);

  if (chdir(config.scratch_dir.c_str()) == -1) {
    die("chdir", errno);
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(FSIZE, config.max_file_size_bytes);
  SET_RLIM(NOFILE, config.max_files);
  SET_RLIM(NPROC, config.max_procs);
  SET_RLIM(CORE, 0);
#undef SET_RLIM

  // The soft limit delivers SIGXCPU, the hard one a SIGKILL a second later.
  if (config.cpu_limit_millis) {
    rlim.rlim_cur = (config.cpu_limit_millis + 999) / 1000;
    rlim.rlim_max = rlim.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rlim) < 0) die("setrlim CPU", errno);
  }

  execve(argv[0], argv, envp);
  die("exec", errno);
}

}  // namespace

namespace sandbox {

std::vector<std::string> Unix::Command(const IsolationConfig& config) const {
  std::string self = Flags::sandbox_binary;
  if (self.empty()) self = whereami::getExecutablePath();
  std::vector<std::string> argv = {self, "sandbox"};
  auto add = [&argv](const char* name, int64_t value) {
    if (!value) return;
    argv.emplace_back(name);
    argv.push_back(std::to_string(value));
  };
  argv.emplace_back("--workdir");
  argv.push_back(config.scratch_dir);
  add("--cpu-ms", config.cpu_limit_millis);
  add("--memory-bytes", config.memory_limit_bytes);
  add("--processes", config.max_procs);
  add("--file-size-bytes", config.max_file_size_bytes);
  add("--open-files", config.max_files);
  if (config.allow_network) argv.emplace_back("--network");
  for (const std::string& var : config.env) {
    argv.emplace_back("--env");
    argv.push_back(var);
  }
  argv.emplace_back("--");
  argv.insert(argv.end(), config.command.begin(), config.command.end());
  return argv;
}

Termination Unix::Interpret(int wait_status, const std::string& report,
                            const IsolationConfig& config) const {
  Termination termination;
  if (report.empty()) {
    if (WIFSIGNALED(wait_status)) {
      termination.kind = Termination::Kind::SIGNALED;
      termination.signal = WTERMSIG(wait_status);
      termination.message = "sandbox killed before reporting";
    } else {
      termination.kind = Termination::Kind::SETUP_FAILED;
      termination.message =
          "sandbox exited with status " +
          std::to_string(WIFEXITED(wait_status) ? WEXITSTATUS(wait_status)
                                                : -1) +
          " without reporting";
    }
    return termination;
  }

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                kj::ArrayInputStream in(kj::arrayPtr(
                    reinterpret_cast<const kj::byte*>(report.data()),  // NOLINT
                    report.size()));
                capnp::InputStreamMessageReader reader(in);
                auto status = reader.getRoot<capnproto::EngineStatus>();
                termination.cpu_time_millis = status.getCpuTimeMs();
                termination.memory_usage_kb = status.getPeakMemoryKb();
                for (auto warning : status.getWarnings()) {
                  termination.log.push_back(
                      std::string("[W] ") + warning.cStr());
                }
                switch (status.which()) {
                  case capnproto::EngineStatus::EXITED:
                    termination.kind = Termination::Kind::EXITED;
                    termination.status_code = status.getExited();
                    break;
                  case capnproto::EngineStatus::SIGNALED:
                    termination.kind = Termination::Kind::SIGNALED;
                    termination.signal = status.getSignaled();
                    break;
                  case capnproto::EngineStatus::SETUP_ERROR:
                    termination.kind = Termination::Kind::SETUP_FAILED;
                    termination.message = status.getSetupError();
                    return;
                }
                switch (status.getExceeded()) {
                  case capnproto::ResourceKind::NONE:
                    return;
                  case capnproto::ResourceKind::MEMORY:
                    termination.resource = Resource::MEMORY;
                    break;
                  case capnproto::ResourceKind::CPU_TIME:
                    termination.resource = Resource::CPU_TIME;
                    break;
                  case capnproto::ResourceKind::PROCESSES:
                    termination.resource = Resource::PROCESSES;
                    break;
                  case capnproto::ResourceKind::FILE_SIZE:
                    termination.resource = Resource::FILE_SIZE;
                    break;
                }
                termination.kind = Termination::Kind::LIMIT_EXCEEDED;
              })) {
    termination = Termination();
    termination.kind = Termination::Kind::SETUP_FAILED;
    termination.message =
        std::string("malformed sandbox report: ") +
        exception->getDescription().cStr();
  }
  return termination;
}

void Unix::Run(const IsolationConfig& config,
               capnproto::EngineStatus::Builder status) {
  char buf[kStrErrorBufSize] = {};
  int pipe_fds[2];
  if (pipe2(pipe_fds, O_CLOEXEC) == -1) {  // NOLINT
    status.setSetupError(std::string("pipe2: ") +
                         mystrerror(errno, buf, kStrErrorBufSize));
    return;
  }
  kj::AutoCloseFd error_read(pipe_fds[0]);
  kj::AutoCloseFd error_write(pipe_fds[1]);
  if (config.command.empty()) {
    status.setSetupError("no command");
    return;
  }

  // The namespace is inherited by the program and everything it starts. It
  // needs CAP_SYS_ADMIN, without it the host network stays visible.
  if (!config.allow_network && unshare(CLONE_NEWNET) == -1) {
    auto warnings = status.initWarnings(1);
    warnings.set(0, std::string("network isolation unavailable: unshare: ") +
                        mystrerror(errno, buf, kStrErrorBufSize));
  }

  std::vector<std::string> args = config.command;
  std::vector<std::string> env = config.env;
  std::vector<char*> argv = CStrings(&args);
  std::vector<char*> envp = CStrings(&env);

  // Started by the supervisor, the sandbox leads the group the supervisor
  // kills and the program stays in it. Otherwise the program gets a group of
  // its own, so that the memory watcher never sees unrelated processes.
  bool own_group = getpgrp() != getpid();

  int child_pid = fork();
  if (child_pid == -1) {
    status.setSetupError(std::string("fork: ") +
                         mystrerror(errno, buf, kStrErrorBufSize));
    return;
  }
  if (child_pid == 0) {
    Child(config, argv.data(), envp.data(), error_write.get(), own_group);
  }
  // Repeated here as the child may not have run yet. Once it has, this fails
  // with EACCES and the group is already in place.
  if (own_group) setpgid(child_pid, child_pid);
  error_write = nullptr;

  std::atomic<bool> done{false};
  std::atomic<bool> memory_killed{false};
  std::atomic<int64_t> peak_memory_kb{0};
  int64_t memory_limit_kb = config.memory_limit_bytes / 1024;
  // Everything the program starts stays in its group unless it leaves on
  // purpose: the limit covers all of them.
  pid_t pgrp = own_group ? child_pid : getpgrp();
  std::thread memory_watcher([&]() {
    std::vector<pid_t> members;
    while (!done) {
      int64_t mem = GetGroupMemoryUsageKb(pgrp, &members);
      if (mem > peak_memory_kb) peak_memory_kb = mem;
      if (memory_limit_kb != 0 && mem > memory_limit_kb && !memory_killed) {
        memory_killed = true;
        for (pid_t pid : members) kill(pid, SIGKILL);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  });

  std::string setup_error;
  ssize_t amount = 0;
  while ((amount = read(error_read, buf, sizeof(buf))) != 0) {  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    setup_error.append(buf, amount);
  }

  // Wait without reaping, so that the watcher never signals a recycled pid.
  siginfo_t info{};
  while (waitid(P_PID, child_pid, &info, WEXITED | WNOWAIT) == -1) {
    KJ_ASSERT(errno == EINTR, "waitid", strerror(errno));
  }
  done = true;
  memory_watcher.join();

  int child_status = 0;
  struct rusage rusage {};
  KJ_SYSCALL(wait4(child_pid, &child_status, 0, &rusage));

  if (!setup_error.empty()) {
    status.setSetupError(setup_error);
    return;
  }

  int64_t cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000 +
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  int64_t memory_usage_kb = std::max<int64_t>(peak_memory_kb, rusage.ru_maxrss);
  status.setCpuTimeMs(cpu_time_millis);
  status.setPeakMemoryKb(memory_usage_kb);

  int signal = 0;
  if (WIFSIGNALED(child_status)) {
    signal = WTERMSIG(child_status);
    status.setSignaled(signal);
  } else {
    status.setExited(WEXITSTATUS(child_status));
  }

  if (memory_killed ||
      (memory_limit_kb != 0 && memory_usage_kb > memory_limit_kb)) {
    status.setExceeded(capnproto::ResourceKind::MEMORY);
  } else if (signal == SIGXCPU ||
             (signal == SIGKILL && config.cpu_limit_millis != 0 &&
              cpu_time_millis >= config.cpu_limit_millis)) {
    status.setExceeded(capnproto::ResourceKind::CPU_TIME);
  } else if (signal == SIGXFSZ) {
    status.setExceeded(capnproto::ResourceKind::FILE_SIZE);
  }
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
