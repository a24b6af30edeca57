#include "supervisor/supervisor.hpp"

#include <csignal>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

// The engine report is a single small message.
const uint64_t kMaxReportBytes = 1 << 20;

bool IsEngineWarning(const std::string& line) {
  return line.compare(0, 3, "[W]") == 0 || line.compare(0, 3, "[E]") == 0 ||
         line.compare(0, 3, "[F]") == 0;
}

}  // namespace

namespace supervisor {

const char* Supervisor::StateName(State state) {
  switch (state) {
    case State::PENDING:
      return "pending";
    case State::CONFIGURING:
      return "configuring";
    case State::LAUNCHING:
      return "launching";
    case State::RUNNING:
      return "running";
    case State::REAPING:
      return "reaping";
    case State::DONE:
      return "done";
    case State::ABORTED:
      return "aborted";
  }
  return "unknown";
}

Supervisor::Supervisor(kj::AsyncIoContext& io,
                       const IsolationConfigBuilder& builder,
                       const sandbox::Sandbox& engine,
                       const ServerLimits& limits, std::string execution_id,
                       ExecutionRequest request,
                       kj::Maybe<ExecutionPool::Slot> slot)
    : io_(io),
      builder_(builder),
      launcher_(engine, io),
      grace_(limits.grace_ms * kj::MILLISECONDS),
      id_(std::move(execution_id)),
      request_(std::move(request)),
      slot_(kj::mv(slot)),
      start_(io.provider->getTimer().now()) {
  auto paf = kj::newPromiseAndFulfiller<void>();
  cancel_promise_ = kj::mv(paf.promise);
  cancel_fulfiller_ = kj::mv(paf.fulfiller);
}

Supervisor::~Supervisor() {
  if (state_ == State::DONE || state_ == State::ABORTED) return;
  if (state_ != State::PENDING) {
    KJ_LOG(WARNING, "execution dropped while in progress", id_,
           StateName(state_));
  }
  DropPending();
  // Kills and reaps the group if it is still around.
  handle_ = nullptr;
  RemoveScratch();
}

void Supervisor::SetState(State state) {
  KJ_LOG(INFO, "state change", id_, StateName(state_), StateName(state));
  state_ = state;
}

void Supervisor::Cancel() {
  if (cancelled_) return;
  if (state_ == State::REAPING || state_ == State::DONE ||
      state_ == State::ABORTED) {
    return;
  }
  KJ_LOG(INFO, "cancellation requested", id_);
  cancelled_ = true;
  cancel_fulfiller_->fulfill();
}

kj::Promise<ExecutionResult> Supervisor::Run() {
  KJ_REQUIRE(state_ == State::PENDING, "execution already started", id_);
  start_ = io_.provider->getTimer().now();
  if (cancelled_) return Finish(outcome::Cancelled(), State::ABORTED);

  SetState(State::CONFIGURING);
  ExecutionPlan plan;
  std::string error_msg;
  if (!builder_.Build(request_, id_, &plan, &error_msg)) {
    return Finish(outcome::LaunchFailed{"invalid configuration: " + error_msg,
                                        error_msg},
                  State::DONE);
  }
  config_ = plan.config;

  SetState(State::LAUNCHING);
  auto launched = launcher_.Launch(id_, plan, &error_msg);
  KJ_IF_MAYBE(handle, launched) {
    handle_ = kj::heap<ExecutionHandle>(kj::mv(*handle));
  }
  else {
    return Finish(outcome::LaunchFailed{
                      "the isolation engine could not be started", error_msg},
                  State::DONE);
  }
  scratch_dir_ = config_.scratch_dir;
  KJ_LOG(INFO, "launched", id_, request_.runtime, launcher_.Engine().Name(),
         handle_->Pid());

  SetState(State::RUNNING);
  return Supervise().catch_(
      [this](kj::Exception&& exception) { return Abort(kj::mv(exception)); });
}

kj::Promise<ExecutionResult> Supervisor::Supervise() {
  ExecutionHandle& handle = *handle_;
  kj::Timer& timer = io_.provider->getTimer();

  collector_ = kj::heap<OutputCollector>(config_.output_limit_bytes);
  drains_ = collector_->Collect(handle.Stdout(), handle.Stderr())
                .catch_([this](kj::Exception&& exception) {
                  KJ_LOG(WARNING, "reading the program output failed", id_,
                         exception.getDescription());
                })
                .fork();
  report_read_ = handle.Report()
                     .readAllBytes(kMaxReportBytes)
                     .then(
                         [this](kj::Array<kj::byte> bytes) {
                           report_.assign(bytes.asChars().begin(),
                                          bytes.size());
                         },
                         [this](kj::Exception&& exception) {
                           KJ_LOG(WARNING, "reading the engine report failed",
                                  id_, exception.getDescription());
                         })
                     .fork();
  stdin_feed_ = handle.FeedStdin(request_.stdin_data)
                    .catch_([this](kj::Exception&& exception) {
                      // Programs are free to exit without reading stdin.
                      KJ_LOG(INFO, "stdin not consumed", id_,
                             exception.getDescription());
                    })
                    .eagerlyEvaluate(nullptr);

  governor_ = kj::heap<TimeoutGovernor>(timer, handle, grace_);
  kj::Promise<void> deadline =
      config_.wall_limit_millis > 0
          ? governor_->Arm(config_.wall_limit_millis * kj::MILLISECONDS)
          : kj::Promise<void>(kj::NEVER_DONE);
  kj::Promise<void> cancel = kj::mv(KJ_ASSERT_NONNULL(cancel_promise_));
  cancel_promise_ = nullptr;

  return handle.OnExit()
      .exclusiveJoin(kj::mv(deadline))
      .exclusiveJoin(cancel.then([this]() { governor_->Terminate(); }))
      .then([this]() { return Reap(); });
}

kj::Promise<ExecutionResult> Supervisor::Reap() {
  SetState(State::REAPING);
  return handle_->OnExit().then([this]() {
    governor_->Disarm();
    // Descendants that outlived the engine share its group, which stays
    // pinned by the unreaped leader.
    handle_->SignalGroup(SIGKILL);
    int wait_status = handle_->Reap();

    auto settled = kj::heapArrayBuilder<kj::Promise<void>>(2);
    settled.add(KJ_ASSERT_NONNULL(drains_).addBranch());
    settled.add(KJ_ASSERT_NONNULL(report_read_).addBranch());
    return kj::joinPromises(settled.finish())
        .exclusiveJoin(io_.provider->getTimer().afterDelay(grace_).then(
            [this]() { streams_abandoned_ = true; }))
        .then([this, wait_status]() { return Conclude(wait_status); });
  });
}

ExecutionResult Supervisor::Conclude(int wait_status) {
  DropPending();
  if (streams_abandoned_) {
    KJ_LOG(WARNING, "pipes still open after the process group was killed",
           id_);
    warnings_.push_back(
        "output was still open after the program ended and was cut short");
  }
  handle_->ClosePipes();

  sandbox::Termination termination =
      launcher_.Engine().Interpret(wait_status, report_, config_);
  for (const std::string& line : termination.log) {
    if (IsEngineWarning(line)) {
      KJ_LOG(WARNING, id_, line);
    } else {
      KJ_LOG(INFO, id_, line);
    }
  }
  if (termination.kind == sandbox::Termination::Kind::SETUP_FAILED) {
    KJ_LOG(WARNING, "the engine failed to set up", id_, termination.message);
  }

  CapturedOutput output = collector_->Freeze();
  Observations observations;
  observations.cancelled = cancelled_;
  observations.deadline_fired = governor_->Fired();
  observations.stdout_truncated = output.stdout_truncated;
  observations.stderr_truncated = output.stderr_truncated;
  observations.termination = std::move(termination);
  return Finish(Classify(observations),
                cancelled_ ? State::ABORTED : State::DONE, std::move(output));
}

ExecutionResult Supervisor::Abort(kj::Exception&& exception) {
  KJ_LOG(ERROR, "execution aborted", id_, exception);
  DropPending();
  if (handle_ && !handle_->Reaped()) {
    handle_->SignalGroup(SIGKILL);
    auto reaped = kj::runCatchingExceptions([this]() { handle_->Reap(); });
    KJ_IF_MAYBE(error, reaped) {
      KJ_LOG(ERROR, "could not reap the engine", id_, *error);
    }
  }
  CapturedOutput output;
  if (collector_) output = collector_->Freeze();
  return Finish(outcome::LaunchFailed{"internal error",
                                      exception.getDescription().cStr()},
                State::ABORTED, std::move(output));
}

ExecutionResult Supervisor::Finish(ExecutionOutcome result, State state,
                                   CapturedOutput output) {
  RemoveScratch();
  slot_ = nullptr;

  ExecutionResult execution;
  execution.output = std::move(output);
  execution.outcome = kj::mv(result);
  execution.duration_ms =
      (io_.provider->getTimer().now() - start_) / kj::MILLISECONDS;
  execution.warnings = std::move(warnings_);
  SetState(state);

  if (execution.outcome.is<outcome::LaunchFailed>()) {
    KJ_LOG(WARNING, "launch failed", id_,
           execution.outcome.get<outcome::LaunchFailed>().detail);
  }
  KJ_LOG(INFO, "finished", id_, OutcomeName(execution.outcome),
         execution.duration_ms, execution.output.stdout_data.size(),
         execution.output.stderr_data.size());
  return execution;
}

void Supervisor::RemoveScratch() {
  if (scratch_dir_.empty()) return;
  std::string scratch_dir = std::move(scratch_dir_);
  scratch_dir_.clear();
  if (Flags::keep_scratch) {
    KJ_LOG(INFO, "keeping scratch path", id_, scratch_dir);
    return;
  }
  try {
    util::File::RemoveTree(scratch_dir);
  } catch (const std::system_error& exc) {
    KJ_LOG(WARNING, "could not remove the scratch path", id_, scratch_dir,
           exc.what());
    warnings_.push_back("the scratch directory could not be cleaned up");
  }
}

void Supervisor::DropPending() {
  stdin_feed_ = nullptr;
  drains_ = nullptr;
  report_read_ = nullptr;
  if (governor_) governor_->Disarm();
}

}  // namespace supervisor
