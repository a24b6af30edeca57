#include "supervisor/config_builder.hpp"

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace supervisor {
namespace {

const constexpr char* kSearchPath = "PATH=/usr/local/bin:/usr/bin:/bin";

bool CheckOverride(const char* name, int64_t requested, int64_t ceiling,
                   std::string* error_msg) {
  if (requested < 0) {
    *error_msg = std::string(name) + " must not be negative";
    return false;
  }
  if (ceiling != 0 && requested > ceiling) {
    *error_msg = std::string(name) + " of " + std::to_string(requested) +
                 " is above the server limit of " + std::to_string(ceiling);
    return false;
  }
  return true;
}

bool ValidId(const std::string& id) {
  if (id.empty()) return false;
  for (char c : id) {
    if (!(('0' <= c && c <= '9') || ('a' <= c && c <= 'f') || c == '-')) {
      return false;
    }
  }
  return true;
}

}  // namespace

int64_t IsolationConfigBuilder::Resolve(int64_t requested, int64_t ceiling) {
  return requested != 0 ? requested : ceiling;
}

std::string IsolationConfigBuilder::Interpreter(const Runtime& runtime) {
  return util::which(runtime.command[0]);
}

bool IsolationConfigBuilder::Validate(const ExecutionRequest& request,
                                      std::string* error_msg) const {
  KJ_IF_MAYBE(runtime, runtimes_.Find(request.runtime)) {
    if (Interpreter(*runtime).empty()) {
      *error_msg = "runtime " + request.runtime + " is not installed";
      return false;
    }
  } else {
    *error_msg = "unknown runtime " + request.runtime;
    return false;
  }
  const Limits& ceilings = limits_.ceilings;
  return CheckOverride("cpu time", request.limits.cpu_time_ms,
                       ceilings.cpu_time_ms, error_msg) &&
         CheckOverride("wall time", request.limits.wall_time_ms,
                       ceilings.wall_time_ms, error_msg) &&
         CheckOverride("memory", request.limits.memory_bytes,
                       ceilings.memory_bytes, error_msg) &&
         CheckOverride("output", request.limits.output_bytes,
                       ceilings.output_bytes, error_msg);
}

bool IsolationConfigBuilder::Build(const ExecutionRequest& request,
                                   const std::string& execution_id,
                                   ExecutionPlan* plan,
                                   std::string* error_msg) const {
  if (!ValidId(execution_id)) {
    *error_msg = "invalid execution id";
    return false;
  }
  if (!Validate(request, error_msg)) return false;
  const Runtime& runtime = KJ_ASSERT_NONNULL(runtimes_.Find(request.runtime));

  ExecutionPlan result;
  sandbox::IsolationConfig& config = result.config;
  config.scratch_dir = util::File::JoinPath(scratch_root_, execution_id);

  const Limits& ceilings = limits_.ceilings;
  config.cpu_limit_millis =
      Resolve(request.limits.cpu_time_ms, ceilings.cpu_time_ms);
  config.wall_limit_millis =
      Resolve(request.limits.wall_time_ms, ceilings.wall_time_ms);
  config.memory_limit_bytes =
      Resolve(request.limits.memory_bytes, ceilings.memory_bytes);
  config.output_limit_bytes =
      Resolve(request.limits.output_bytes, ceilings.output_bytes);
  config.max_procs = limits_.max_procs;
  config.max_files = limits_.max_open_files;
  config.max_file_size_bytes = limits_.max_file_size_bytes;
  config.allow_network = false;
  config.env = {kSearchPath, "LANG=C.UTF-8"};

  // The source expands to the file name when it is written to the scratch
  // path, to the text itself otherwise.
  const std::string& expansion =
      runtime.source_file.empty() ? request.source : runtime.source_file;
  config.command.push_back(Interpreter(runtime));
  for (size_t i = 1; i < runtime.command.size(); i++) {
    config.command.push_back(
        util::replaceAll(runtime.command[i], kSourcePlaceholder, expansion));
  }

  result.source_file = runtime.source_file;
  result.source = request.source;
  result.stdin_data = request.stdin_data;
  *plan = std::move(result);
  return true;
}

}  // namespace supervisor
