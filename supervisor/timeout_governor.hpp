#ifndef SUPERVISOR_TIMEOUT_GOVERNOR_HPP
#define SUPERVISOR_TIMEOUT_GOVERNOR_HPP

#include <kj/async.h>
#include <kj/async-io.h>

#include "supervisor/launcher.hpp"

namespace supervisor {

// Terminates the process group of one execution: SIGTERM first, then SIGKILL
// if the group is still around after the grace period. Bound to a single
// handle; once disarmed it never signals again, which must happen before the
// handle is reaped.
class TimeoutGovernor {
 public:
  TimeoutGovernor(kj::Timer& timer, ExecutionHandle& handle,
                  kj::Duration grace)
      : timer_(timer), handle_(handle), grace_(grace) {}

  // Resolves once the timeout expired and the group has been told to
  // terminate. Never resolves if the execution ended first, or if the
  // governor was disarmed.
  kj::Promise<void> Arm(kj::Duration timeout);

  // Starts terminating the group now. Only the first call has an effect.
  void Terminate();

  // Drops the pending escalation; later calls do nothing.
  void Disarm();

  // True if the deadline caused the termination.
  bool Fired() const { return fired_; }

 private:
  kj::Timer& timer_;
  ExecutionHandle& handle_;
  kj::Duration grace_;
  bool fired_ = false;
  bool terminating_ = false;
  bool disarmed_ = false;
  kj::Maybe<kj::Promise<void>> escalation_;
};

}  // namespace supervisor

#endif
