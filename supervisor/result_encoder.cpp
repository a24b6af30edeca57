#include "supervisor/result_encoder.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

namespace {

capnproto::ResourceKind ToWire(sandbox::Resource resource) {
  switch (resource) {
    case sandbox::Resource::NONE:
      return capnproto::ResourceKind::NONE;
    case sandbox::Resource::MEMORY:
      return capnproto::ResourceKind::MEMORY;
    case sandbox::Resource::CPU_TIME:
      return capnproto::ResourceKind::CPU_TIME;
    case sandbox::Resource::PROCESSES:
      return capnproto::ResourceKind::PROCESSES;
    case sandbox::Resource::FILE_SIZE:
      return capnproto::ResourceKind::FILE_SIZE;
  }
  KJ_FAIL_ASSERT("unknown resource", static_cast<int>(resource));
}

kj::ArrayPtr<const kj::byte> Bytes(const std::string& data) {
  return kj::arrayPtr(reinterpret_cast<const kj::byte*>(data.data()),
                      data.size());
}

}  // namespace

namespace supervisor {

void Encode(const ExecutionResult& result,
            capnproto::ExecutionResult::Builder builder) {
  builder.setStdout(Bytes(result.output.stdout_data));
  builder.setStdoutTruncated(result.output.stdout_truncated);
  builder.setStderr(Bytes(result.output.stderr_data));
  builder.setStderrTruncated(result.output.stderr_truncated);

  auto outcome_builder = builder.initOutcome();
  const ExecutionOutcome& result_outcome = result.outcome;
  if (result_outcome.is<outcome::Completed>()) {
    outcome_builder.setCompleted(
        result_outcome.get<outcome::Completed>().exit_code);
  } else if (result_outcome.is<outcome::TimedOut>()) {
    outcome_builder.setTimedOut();
  } else if (result_outcome.is<outcome::Signaled>()) {
    outcome_builder.setSignaled(result_outcome.get<outcome::Signaled>().signal);
  } else if (result_outcome.is<outcome::OutputLimitExceeded>()) {
    outcome_builder.setOutputLimitExceeded();
  } else if (result_outcome.is<outcome::ResourceLimitExceeded>()) {
    outcome_builder.setResourceLimitExceeded(
        ToWire(result_outcome.get<outcome::ResourceLimitExceeded>().resource));
  } else if (result_outcome.is<outcome::LaunchFailed>()) {
    outcome_builder.setLaunchFailed(
        result_outcome.get<outcome::LaunchFailed>().reason);
  } else if (result_outcome.is<outcome::Cancelled>()) {
    outcome_builder.setCancelled();
  } else {
    KJ_FAIL_ASSERT("execution result without an outcome");
  }

  builder.setDurationMs(result.duration_ms);
  auto warnings = builder.initWarnings(result.warnings.size());
  for (size_t i = 0; i < result.warnings.size(); i++) {
    warnings.set(i, result.warnings[i]);
  }
}

void EncodeRejection(capnproto::Rejection::Reason reason,
                     const std::string& message,
                     capnproto::Rejection::Builder builder) {
  builder.setReason(reason);
  builder.setMessage(message);
}

void EncodeRequest(const ExecutionRequest& request,
                   capnproto::ExecutionRequest::Builder builder) {
  builder.setRuntime(request.runtime);
  builder.setSource(request.source);
  KJ_IF_MAYBE(data, request.stdin_data) {
    builder.setStdin(Bytes(*data));
    builder.setHasStdin(true);
  }
  auto limits = builder.initLimits();
  limits.setCpuTimeMs(request.limits.cpu_time_ms);
  limits.setWallTimeMs(request.limits.wall_time_ms);
  limits.setMemoryBytes(request.limits.memory_bytes);
  limits.setOutputBytes(request.limits.output_bytes);
}

ExecutionRequest DecodeRequest(capnproto::ExecutionRequest::Reader reader) {
  ExecutionRequest request;
  request.runtime = reader.getRuntime();
  request.source = reader.getSource();
  if (reader.getHasStdin()) {
    auto data = reader.getStdin();
    request.stdin_data =
        std::string(reinterpret_cast<const char*>(data.begin()), data.size());
  }
  auto limits = reader.getLimits();
  request.limits.cpu_time_ms = limits.getCpuTimeMs();
  request.limits.wall_time_ms = limits.getWallTimeMs();
  request.limits.memory_bytes = limits.getMemoryBytes();
  request.limits.output_bytes = limits.getOutputBytes();
  return request;
}

std::string ToJson(capnproto::Response::Reader response) {
  capnp::JsonCodec codec;
  codec.setPrettyPrint(true);
  codec.handleByAnnotation<capnproto::Response>();
  return codec.encode(response).cStr();
}

std::string ToJson(const ExecutionResult& result) {
  capnp::MallocMessageBuilder message;
  auto response = message.initRoot<capnproto::Response>();
  Encode(result, response.initResult());
  return ToJson(response.asReader());
}

}  // namespace supervisor
