#ifndef SUPERVISOR_CONFIG_BUILDER_HPP
#define SUPERVISOR_CONFIG_BUILDER_HPP

#include <string>

#include "supervisor/execution.hpp"
#include "supervisor/runtime.hpp"

namespace supervisor {

// Turns requests into execution plans. Apart from reading the runtime table,
// it has no side effects: the scratch path is only named here, the launcher
// creates it.
class IsolationConfigBuilder {
 public:
  IsolationConfigBuilder(const RuntimeTable& runtimes,
                         const ServerLimits& limits, std::string scratch_root)
      : runtimes_(runtimes),
        limits_(limits),
        scratch_root_(std::move(scratch_root)) {}

  // Checks that the request names a known runtime whose interpreter can be
  // found, and that its overrides only narrow the server ceilings. Returns
  // false and sets error_msg otherwise.
  bool Validate(const ExecutionRequest& request, std::string* error_msg) const;

  // Validates the request and resolves it into a plan for the execution with
  // the given id. The scratch path is derived from the id, which must only
  // contain lowercase hex digits and dashes.
  bool Build(const ExecutionRequest& request, const std::string& execution_id,
             ExecutionPlan* plan, std::string* error_msg) const;

  // Limit actually applied: the override if set, the ceiling otherwise.
  static int64_t Resolve(int64_t requested, int64_t ceiling);

 private:
  // Absolute path of the interpreter of runtime, empty if not found.
  static std::string Interpreter(const Runtime& runtime);

  const RuntimeTable& runtimes_;
  ServerLimits limits_;
  std::string scratch_root_;
};

}  // namespace supervisor

#endif
