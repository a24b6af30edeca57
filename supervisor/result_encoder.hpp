#ifndef SUPERVISOR_RESULT_ENCODER_HPP
#define SUPERVISOR_RESULT_ENCODER_HPP

#include <string>

#include "capnp/snekbox.capnp.h"
#include "supervisor/execution.hpp"

namespace supervisor {

// Fills builder with result. Only the caller-safe part of the result is
// encoded: the detail of a launch failure, host paths and pids are never part
// of it.
void Encode(const ExecutionResult& result,
            capnproto::ExecutionResult::Builder builder);

void EncodeRejection(capnproto::Rejection::Reason reason,
                     const std::string& message,
                     capnproto::Rejection::Builder builder);

void EncodeRequest(const ExecutionRequest& request,
                   capnproto::ExecutionRequest::Builder builder);
ExecutionRequest DecodeRequest(capnproto::ExecutionRequest::Reader reader);

// JSON rendering of a response, with the outputs encoded in base64.
std::string ToJson(capnproto::Response::Reader response);
std::string ToJson(const ExecutionResult& result);

}  // namespace supervisor

#endif
