#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "capnp/snekbox.capnp.h"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox that only uses process-level facilities available to any user:
// resource limits, a cleared environment, a private working directory and,
// when the kernel allows it, a private network namespace. The sandbox program
// is this same executable, re-executed with the `sandbox` subcommand, which
// writes an EngineStatus message on kReportFd.
class Unix : public Sandbox {
 public:
  static const constexpr char* kName = "unix";
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

  const char* Name() const override { return kName; }
  std::vector<std::string> Command(
      const IsolationConfig& config) const override;
  Termination Interpret(int wait_status, const std::string& report,
                        const IsolationConfig& config) const override;

  // Runs config.command as a child of the calling process and waits for it,
  // killing it if it goes over the memory limit. Fills status with how the
  // command ended.
  static void Run(const IsolationConfig& config,
                  capnproto::EngineStatus::Builder status);

 protected:
  Unix() = default;
};

}  // namespace sandbox
#endif
