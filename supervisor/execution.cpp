#include "supervisor/execution.hpp"

#include "util/flags.hpp"

namespace supervisor {

ServerLimits ServerLimits::FromFlags() {
  ServerLimits limits;
  limits.ceilings.cpu_time_ms = Flags::max_cpu_time_ms;
  limits.ceilings.wall_time_ms = Flags::max_wall_time_ms;
  limits.ceilings.memory_bytes = Flags::max_memory_bytes;
  limits.ceilings.output_bytes = Flags::max_output_bytes;
  limits.max_procs = Flags::max_processes;
  limits.max_file_size_bytes = Flags::max_file_size_bytes;
  limits.max_open_files = Flags::max_open_files;
  limits.max_concurrent_executions = Flags::max_concurrent_executions;
  limits.grace_ms = Flags::grace_ms;
  return limits;
}

const char* OutcomeName(const ExecutionOutcome& result) {
  if (result.is<outcome::Completed>()) return "completed";
  if (result.is<outcome::TimedOut>()) return "timed_out";
  if (result.is<outcome::Signaled>()) return "signaled";
  if (result.is<outcome::OutputLimitExceeded>()) {
    return "output_limit_exceeded";
  }
  if (result.is<outcome::ResourceLimitExceeded>()) {
    return "resource_limit_exceeded";
  }
  if (result.is<outcome::LaunchFailed>()) return "launch_failed";
  if (result.is<outcome::Cancelled>()) return "cancelled";
  return "none";
}

ExecutionOutcome Classify(const Observations& observations) {
  using Kind = sandbox::Termination::Kind;
  const sandbox::Termination& termination = observations.termination;
  bool truncated =
      observations.stdout_truncated || observations.stderr_truncated;
  ExecutionOutcome result;

  if (observations.cancelled) {
    result.init<outcome::Cancelled>();
  } else if (termination.kind == Kind::SETUP_FAILED) {
    result.init<outcome::LaunchFailed>(outcome::LaunchFailed{
        "the isolation engine could not start the program",
        termination.message});
  } else if (termination.kind == Kind::LIMIT_EXCEEDED &&
             !(observations.deadline_fired &&
               termination.resource == sandbox::Resource::MEMORY)) {
    // Engines infer memory exhaustion from a SIGKILL, which is also how the
    // deadline ends a program.
    result.init<outcome::ResourceLimitExceeded>(
        outcome::ResourceLimitExceeded{termination.resource});
  } else if (observations.deadline_fired) {
    if (truncated) {
      result.init<outcome::OutputLimitExceeded>();
    } else {
      result.init<outcome::TimedOut>();
    }
  } else if (termination.kind == Kind::SIGNALED) {
    result.init<outcome::Signaled>(outcome::Signaled{termination.signal});
  } else if (truncated) {
    result.init<outcome::OutputLimitExceeded>();
  } else {
    result.init<outcome::Completed>(
        outcome::Completed{termination.status_code});
  }
  return result;
}

}  // namespace supervisor
