#ifndef SUPERVISOR_SUPERVISOR_HPP
#define SUPERVISOR_SUPERVISOR_HPP

#include <string>
#include <vector>

#include <kj/async-io.h>

#include "sandbox/sandbox.hpp"
#include "supervisor/config_builder.hpp"
#include "supervisor/execution.hpp"
#include "supervisor/execution_pool.hpp"
#include "supervisor/launcher.hpp"
#include "supervisor/output_collector.hpp"
#include "supervisor/timeout_governor.hpp"

namespace supervisor {

// Runs one execution from configuration to reaping:
//
//   PENDING -> CONFIGURING -> LAUNCHING -> RUNNING -> REAPING -> DONE
//
// with ABORTED entered instead of DONE on cancellation or internal error.
// While RUNNING it waits for the first of program exit, deadline and
// cancellation. Whatever happens, the process group is killed and reaped and
// exactly one result is produced.
//
// The supervisor must outlive the promise returned by Run. Destroying it
// before that promise resolved kills and reaps the process group and removes
// the scratch path.
class Supervisor {
 public:
  enum class State {
    PENDING,
    CONFIGURING,
    LAUNCHING,
    RUNNING,
    REAPING,
    DONE,
    ABORTED
  };
  static const char* StateName(State state);

  Supervisor(kj::AsyncIoContext& io, const IsolationConfigBuilder& builder,
             const sandbox::Sandbox& engine, const ServerLimits& limits,
             std::string execution_id, ExecutionRequest request,
             kj::Maybe<ExecutionPool::Slot> slot = nullptr);
  ~Supervisor();
  KJ_DISALLOW_COPY(Supervisor);

  // Runs the execution. Must be called once.
  kj::Promise<ExecutionResult> Run();

  // Terminates the process group the same way the deadline does, and makes
  // the outcome Cancelled. Does nothing once the program has ended.
  void Cancel();

  State GetState() const { return state_; }
  const std::string& Id() const { return id_; }

 private:
  kj::Promise<ExecutionResult> Supervise();
  kj::Promise<ExecutionResult> Reap();
  ExecutionResult Conclude(int wait_status);
  ExecutionResult Abort(kj::Exception&& exception);
  ExecutionResult Finish(ExecutionOutcome outcome, State state,
                         CapturedOutput output = CapturedOutput());
  void SetState(State state);
  void RemoveScratch();
  void DropPending();

  kj::AsyncIoContext& io_;
  const IsolationConfigBuilder& builder_;
  ProcessLauncher launcher_;
  kj::Duration grace_;
  std::string id_;
  ExecutionRequest request_;
  kj::Maybe<ExecutionPool::Slot> slot_;

  State state_ = State::PENDING;
  bool cancelled_ = false;
  bool streams_abandoned_ = false;
  kj::TimePoint start_;
  sandbox::IsolationConfig config_;
  std::string scratch_dir_;
  std::string report_;
  std::vector<std::string> warnings_;

  // Declared in dependency order: everything below refers to the handle.
  kj::Own<ExecutionHandle> handle_;
  kj::Own<OutputCollector> collector_;
  kj::Own<TimeoutGovernor> governor_;
  kj::Own<kj::PromiseFulfiller<void>> cancel_fulfiller_;
  kj::Maybe<kj::Promise<void>> cancel_promise_;
  kj::Maybe<kj::ForkedPromise<void>> drains_;
  kj::Maybe<kj::ForkedPromise<void>> report_read_;
  kj::Maybe<kj::Promise<void>> stdin_feed_;
};

}  // namespace supervisor

#endif
