#ifndef SANDBOX_NSJAIL_HPP
#define SANDBOX_NSJAIL_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox based on nsjail: a read-only view of the host filesystem with the
// scratch directory mounted writable on kSandboxMountPoint, private
// namespaces, cgroup limits on memory and processes, rlimits and an optional
// seccomp policy. nsjail logs on kReportFd.
class NsJail : public Sandbox {
 public:
  static const constexpr char* kName = "nsjail";
  static Sandbox* Create() { return new NsJail(); }
  // Preferred whenever the nsjail binary can be found.
  static int Score();

  const char* Name() const override { return kName; }
  std::vector<std::string> Command(
      const IsolationConfig& config) const override;
  Termination Interpret(int wait_status, const std::string& report,
                        const IsolationConfig& config) const override;

 protected:
  NsJail() = default;
};

}  // namespace sandbox
#endif
