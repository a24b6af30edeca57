#ifndef SUPERVISOR_LAUNCHER_HPP
#define SUPERVISOR_LAUNCHER_HPP

#include <sys/types.h>
#include <string>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/io.h>

#include "sandbox/sandbox.hpp"
#include "supervisor/execution.hpp"

namespace supervisor {

// A running execution: the isolation engine process, leader of its own
// process group, and the pipes connected to it. Move-only; destroying a
// handle that was not reaped kills the whole group and reaps the leader.
class ExecutionHandle {
 public:
  ExecutionHandle(std::string id, pid_t pid, kj::AutoCloseFd pidfd,
                  kj::UnixEventPort& event_port);
  ~ExecutionHandle();

  ExecutionHandle(ExecutionHandle&& other) = default;
  ExecutionHandle& operator=(ExecutionHandle&& other) = delete;
  KJ_DISALLOW_COPY(ExecutionHandle);

  const std::string& Id() const { return id_; }
  pid_t Pid() const { return pid_; }

  // Resolves when the leader exits. May be called any number of times.
  kj::Promise<void> OnExit() { return exit_.addBranch(); }

  // True once the leader has exited, reaped or not.
  bool HasExited() const;
  bool Reaped() const { return reaped_; }

  // Sends signal to every process of the group. Does nothing once the leader
  // has been reaped, as the group id may then be reused.
  void SignalGroup(int signal);

  // Collects the exit status of the leader. Blocks until it exits, so it is
  // meant to be called after OnExit resolved.
  int Reap();

  // Writes data on the program's stdin, then closes it. With no data, stdin
  // is closed right away. The handle must not be moved afterwards.
  kj::Promise<void> FeedStdin(kj::Maybe<std::string> data);

  kj::AsyncInputStream& Stdout() { return *stdout_; }
  kj::AsyncInputStream& Stderr() { return *stderr_; }
  kj::AsyncInputStream& Report() { return *report_; }

  // Closes the read side of every pipe.
  void ClosePipes();

 private:
  friend class ProcessLauncher;

  std::string id_;
  pid_t pid_;
  kj::AutoCloseFd pidfd_;
  bool reaped_ = false;
  kj::Own<kj::UnixEventPort::FdObserver> exit_observer_;
  kj::ForkedPromise<void> exit_;
  kj::Own<kj::AsyncOutputStream> stdin_;
  kj::Own<kj::AsyncInputStream> stdout_;
  kj::Own<kj::AsyncInputStream> stderr_;
  kj::Own<kj::AsyncInputStream> report_;
};

// Starts isolation engine processes.
class ProcessLauncher {
 public:
  ProcessLauncher(const sandbox::Sandbox& engine, kj::AsyncIoContext& io)
      : engine_(engine), io_(io) {}

  // Creates the scratch path, writes the source file if the plan has one and
  // spawns the engine on the plan's config, in a new process group, with
  // pipes for stdin, stdout, stderr and the engine report. Returns nullptr and
  // sets error_msg if any of this fails; the scratch path is removed in that
  // case.
  kj::Maybe<ExecutionHandle> Launch(const std::string& execution_id,
                                    const ExecutionPlan& plan,
                                    std::string* error_msg);

  const sandbox::Sandbox& Engine() const { return engine_; }

 private:
  const sandbox::Sandbox& engine_;
  kj::AsyncIoContext& io_;
};

}  // namespace supervisor

#endif
