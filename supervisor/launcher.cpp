#include "supervisor/launcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <vector>

#include <kj/debug.h>

#include "util/file.hpp"

#ifndef SYS_pidfd_open
#define SYS_pidfd_open 434
#endif

extern char** environ;

namespace supervisor {
namespace {

// Pipe ends are moved above the standard descriptors and the report fd, so
// that the dup2 calls of the child never see a descriptor on its own target.
const constexpr int kMinPipeFd = 10;

struct Pipe {
  kj::AutoCloseFd read;
  kj::AutoCloseFd write;
};

bool MakePipe(Pipe* pipe, std::string* error_msg) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = std::string("pipe2: ") + strerror(errno);
    return false;
  }
  kj::AutoCloseFd ends[2] = {kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1])};
  for (int i = 0; i < 2; i++) {
    int moved = fcntl(ends[i], F_DUPFD_CLOEXEC, kMinPipeFd);
    if (moved == -1) {
      *error_msg = std::string("fcntl: ") + strerror(errno);
      return false;
    }
    ends[i] = kj::AutoCloseFd(moved);
  }
  pipe->read = kj::mv(ends[0]);
  pipe->write = kj::mv(ends[1]);
  return true;
}

// Owns the posix_spawn attribute objects.
class SpawnSetup {
 public:
  SpawnSetup() {
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);
  }
  ~SpawnSetup() {
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
  }
  KJ_DISALLOW_COPY(SpawnSetup);

  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
};

}  // namespace

ExecutionHandle::ExecutionHandle(std::string id, pid_t pid,
                                 kj::AutoCloseFd pidfd,
                                 kj::UnixEventPort& event_port)
    : id_(std::move(id)),
      pid_(pid),
      pidfd_(kj::mv(pidfd)),
      exit_observer_(kj::heap<kj::UnixEventPort::FdObserver>(
          event_port, pidfd_.get(),
          kj::UnixEventPort::FdObserver::OBSERVE_READ)),
      exit_(exit_observer_->whenBecomesReadable().fork()) {}

ExecutionHandle::~ExecutionHandle() {
  // Moved-from handles have no pidfd.
  if (pidfd_.get() == -1 || reaped_) return;
  SignalGroup(SIGKILL);
  int status = 0;
  while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
  }
  reaped_ = true;
}

bool ExecutionHandle::HasExited() const {
  if (reaped_) return true;
  struct pollfd pfd {};
  pfd.fd = pidfd_.get();
  pfd.events = POLLIN;
  return poll(&pfd, 1, 0) > 0;
}

void ExecutionHandle::SignalGroup(int signal) {
  if (reaped_) return;
  if (kill(-pid_, signal) == -1 && errno != ESRCH) {
    KJ_LOG(WARNING, "kill", id_, signal, strerror(errno));
  }
}

int ExecutionHandle::Reap() {
  KJ_REQUIRE(!reaped_, "execution already reaped", id_);
  int status = 0;
  KJ_SYSCALL(waitpid(pid_, &status, 0), id_);
  reaped_ = true;
  return status;
}

kj::Promise<void> ExecutionHandle::FeedStdin(kj::Maybe<std::string> data) {
  std::string payload;
  KJ_IF_MAYBE(d, data) { payload = kj::mv(*d); }
  if (payload.empty()) {
    stdin_ = nullptr;
    return kj::READY_NOW;
  }
  auto buffer = kj::heap<std::string>(kj::mv(payload));
  auto promise = stdin_->write(buffer->data(), buffer->size());
  return promise.attach(kj::mv(buffer)).then([this]() { stdin_ = nullptr; });
}

void ExecutionHandle::ClosePipes() {
  stdin_ = nullptr;
  stdout_ = nullptr;
  stderr_ = nullptr;
  report_ = nullptr;
}

kj::Maybe<ExecutionHandle> ProcessLauncher::Launch(
    const std::string& execution_id, const ExecutionPlan& plan,
    std::string* error_msg) {
  const sandbox::IsolationConfig& config = plan.config;
  try {
    util::File::MakeDir(config.scratch_dir, 0700);
  } catch (const std::system_error& exc) {
    *error_msg = std::string("creating the scratch path: ") + exc.what();
    return nullptr;
  }
  auto fail = [&config, &error_msg](std::string msg) {
    *error_msg = std::move(msg);
    try {
      util::File::RemoveTree(config.scratch_dir);
    } catch (const std::system_error& exc) {
      KJ_LOG(WARNING, "removing the scratch path", config.scratch_dir,
             exc.what());
    }
    return nullptr;
  };

  if (!plan.source_file.empty()) {
    try {
      util::File::WriteString(
          util::File::JoinPath(config.scratch_dir, plan.source_file),
          plan.source, 0644);
    } catch (const std::system_error& exc) {
      return fail(std::string("writing the source: ") + exc.what());
    }
  }

  Pipe stdin_pipe, stdout_pipe, stderr_pipe, report_pipe;
  std::string pipe_error;
  if (!MakePipe(&stdin_pipe, &pipe_error) ||
      !MakePipe(&stdout_pipe, &pipe_error) ||
      !MakePipe(&stderr_pipe, &pipe_error) ||
      !MakePipe(&report_pipe, &pipe_error)) {
    return fail(pipe_error);
  }

  SpawnSetup setup;
  posix_spawn_file_actions_adddup2(&setup.actions, stdin_pipe.read,
                                   STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&setup.actions, stdout_pipe.write,
                                   STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&setup.actions, stderr_pipe.write,
                                   STDERR_FILENO);
  posix_spawn_file_actions_adddup2(&setup.actions, report_pipe.write,
                                   sandbox::kReportFd);

  // A new process group led by the engine, with a clean signal state.
  sigset_t mask;
  sigemptyset(&mask);
  sigset_t defaults;
  sigfillset(&defaults);
  sigdelset(&defaults, SIGKILL);
  sigdelset(&defaults, SIGSTOP);
  posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETPGROUP |
                                            POSIX_SPAWN_SETSIGMASK |
                                            POSIX_SPAWN_SETSIGDEF);
  posix_spawnattr_setpgroup(&setup.attr, 0);
  posix_spawnattr_setsigmask(&setup.attr, &mask);
  posix_spawnattr_setsigdefault(&setup.attr, &defaults);

  std::vector<std::string> args = engine_.Command(config);
  std::vector<char*> argv;
  for (std::string& arg : args) argv.push_back(&arg[0]);
  argv.push_back(nullptr);

  pid_t pid = 0;
  int ret = posix_spawn(&pid, argv[0], &setup.actions, &setup.attr,
                        argv.data(), environ);
  if (ret != 0) {
    return fail(std::string("spawning ") + engine_.Name() + ": " +
                strerror(ret));
  }

  int pidfd = syscall(SYS_pidfd_open, pid, 0);
  if (pidfd == -1) {
    std::string err = std::string("pidfd_open: ") + strerror(errno);
    kill(-pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    return fail(err);
  }
  // pidfds are always close-on-exec.
  ExecutionHandle handle(execution_id, pid, kj::AutoCloseFd(pidfd),
                         io_.unixEventPort);
  auto flags = kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
               kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;
  handle.stdin_ =
      io_.lowLevelProvider->wrapOutputFd(stdin_pipe.write.release(), flags);
  handle.stdout_ =
      io_.lowLevelProvider->wrapInputFd(stdout_pipe.read.release(), flags);
  handle.stderr_ =
      io_.lowLevelProvider->wrapInputFd(stderr_pipe.read.release(), flags);
  handle.report_ =
      io_.lowLevelProvider->wrapInputFd(report_pipe.read.release(), flags);
  // The child ends are closed here, when the Pipe objects go away.
  return kj::mv(handle);
}

}  // namespace supervisor
