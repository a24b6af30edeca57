#ifndef SUPERVISOR_EXECUTION_HPP
#define SUPERVISOR_EXECUTION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/one-of.h>

#include "sandbox/sandbox.hpp"

namespace supervisor {

// Time, memory and output limits. In a request, 0 means "use the server
// ceiling"; as a ceiling, 0 means unlimited.
struct Limits {
  int64_t cpu_time_ms = 0;
  int64_t wall_time_ms = 0;
  int64_t memory_bytes = 0;
  int64_t output_bytes = 0;
};

// Server-wide settings every execution is bounded by.
struct ServerLimits {
  Limits ceilings;
  int64_t max_procs = 0;
  int64_t max_file_size_bytes = 0;
  int64_t max_open_files = 0;
  int32_t max_concurrent_executions = 1;
  // Time given to a signalled process group, and to its pipes, before
  // escalating.
  int64_t grace_ms = 500;

  // Reads the limits from the command line flags.
  static ServerLimits FromFlags();
};

struct ExecutionRequest {
  std::string runtime;
  std::string source;
  kj::Maybe<std::string> stdin_data;
  Limits limits;
};

// Everything the launcher needs for one execution.
struct ExecutionPlan {
  sandbox::IsolationConfig config;
  // Name of the file, relative to the scratch path, the source has to be
  // written to before the program starts. Empty if the source is passed as an
  // argument.
  std::string source_file;
  std::string source;
  kj::Maybe<std::string> stdin_data;
};

struct CapturedOutput {
  std::string stdout_data;
  bool stdout_truncated = false;
  std::string stderr_data;
  bool stderr_truncated = false;
};

namespace outcome {
struct Completed {
  int32_t exit_code;
};
struct TimedOut {};
struct Signaled {
  int32_t signal;
};
struct OutputLimitExceeded {};
struct ResourceLimitExceeded {
  sandbox::Resource resource;
};
struct LaunchFailed {
  // Returned to the caller.
  std::string reason;
  // Only logged, may contain paths.
  std::string detail;
};
struct Cancelled {};
}  // namespace outcome

using ExecutionOutcome =
    kj::OneOf<outcome::Completed, outcome::TimedOut, outcome::Signaled,
              outcome::OutputLimitExceeded, outcome::ResourceLimitExceeded,
              outcome::LaunchFailed, outcome::Cancelled>;

// Short name of the outcome variant, for logs.
const char* OutcomeName(const ExecutionOutcome& result);

struct ExecutionResult {
  CapturedOutput output;
  ExecutionOutcome outcome;
  int64_t duration_ms = 0;
  // Problems found after the outcome was determined, safe to show to callers.
  std::vector<std::string> warnings;
};

// What the supervisor observed about an execution once it was reaped.
struct Observations {
  bool cancelled = false;
  bool deadline_fired = false;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  sandbox::Termination termination;
};

// Maps the observations to exactly one outcome. The first matching rule wins:
// cancellation, sandbox setup failure, limit reported by the sandbox, deadline
// (output limit if a stream was truncated), signal death, normal exit (output
// limit if a stream was truncated).
ExecutionOutcome Classify(const Observations& observations);

}  // namespace supervisor

#endif
