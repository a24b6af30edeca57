#include "supervisor/timeout_governor.hpp"

#include <csignal>

#include <kj/debug.h>

namespace supervisor {

kj::Promise<void> TimeoutGovernor::Arm(kj::Duration timeout) {
  return timer_.afterDelay(timeout).then([this]() -> kj::Promise<void> {
    if (disarmed_ || handle_.HasExited()) return kj::NEVER_DONE;
    fired_ = true;
    KJ_LOG(INFO, "deadline expired", handle_.Id());
    Terminate();
    return kj::READY_NOW;
  });
}

void TimeoutGovernor::Terminate() {
  if (disarmed_ || terminating_) return;
  terminating_ = true;
  handle_.SignalGroup(SIGTERM);
  escalation_ = timer_.afterDelay(grace_)
                    .then([this]() {
                      if (disarmed_) return;
                      KJ_LOG(INFO, "escalating to SIGKILL", handle_.Id());
                      handle_.SignalGroup(SIGKILL);
                    })
                    .eagerlyEvaluate(nullptr);
}

void TimeoutGovernor::Disarm() {
  disarmed_ = true;
  escalation_ = nullptr;
}

}  // namespace supervisor
