#include "server/server.hpp"

#include <kj/debug.h>

#include "supervisor/result_encoder.hpp"
#include "util/misc.hpp"

namespace server {

Reply Reply::Completed(supervisor::ExecutionResult result) {
  Reply reply;
  reply.result = kj::mv(result);
  return reply;
}

Reply Reply::Rejected(capnproto::Rejection::Reason reason,
                      std::string message) {
  Reply reply;
  reply.reason = reason;
  reply.message = std::move(message);
  return reply;
}

void Reply::Fill(capnproto::Response::Builder response) const {
  KJ_IF_MAYBE(r, result) {
    supervisor::Encode(*r, response.initResult());
  } else {
    supervisor::EncodeRejection(reason, message, response.initRejected());
  }
}

kj::Promise<void> Execution::getResult(GetResultContext context) {
  return reply_.addBranch().then([context](Reply reply) mutable {
    reply.Fill(context.getResults().initResponse());
  });
}

kj::Promise<void> Execution::cancel(CancelContext context) {
  server_.Cancel(id_);
  return kj::READY_NOW;
}

Server::Server(kj::AsyncIoContext& io, const sandbox::Sandbox& engine,
               const supervisor::RuntimeTable& runtimes,
               const supervisor::ServerLimits& limits,
               std::string scratch_root)
    : io_(io),
      engine_(engine),
      limits_(limits),
      builder_(runtimes, limits, std::move(scratch_root)),
      pool_(limits.max_concurrent_executions) {}

std::string Server::NewId() const {
  std::string id;
  do {
    id = util::randomHex(8) + "-" + util::randomHex(8);
  } while (running_.count(id));
  return id;
}

kj::Promise<Reply> Server::Submit(supervisor::ExecutionRequest request,
                                  std::string* execution_id) {
  std::string error_msg;
  if (!builder_.Validate(request, &error_msg)) {
    KJ_LOG(INFO, "request rejected", request.runtime, error_msg);
    return Reply::Rejected(capnproto::Rejection::Reason::CONFIG_ERROR,
                           error_msg);
  }
  auto slot = pool_.Admit();
  if (slot == nullptr) {
    KJ_LOG(INFO, "request rejected, at capacity", pool_.Capacity());
    return Reply::Rejected(capnproto::Rejection::Reason::AT_CAPACITY,
                           "too many executions are running, retry later");
  }

  std::string id = NewId();
  auto supervisor = kj::heap<supervisor::Supervisor>(
      io_, builder_, engine_, limits_, id, kj::mv(request), kj::mv(slot));
  supervisor::Supervisor& ref = *supervisor;
  running_.emplace(id, &ref);
  *execution_id = id;
  return ref.Run()
      .then([](supervisor::ExecutionResult result) {
        return Reply::Completed(kj::mv(result));
      })
      .attach(kj::defer([this, id]() { running_.erase(id); }),
              kj::mv(supervisor));
}

bool Server::Cancel(const std::string& execution_id) {
  auto it = running_.find(execution_id);
  if (it == running_.end()) return false;
  it->second->Cancel();
  return true;
}

kj::Promise<void> Server::eval(EvalContext context) {
  std::string id;
  auto request =
      supervisor::DecodeRequest(context.getParams().getRequest());
  return Submit(kj::mv(request), &id).then([context](Reply reply) mutable {
    reply.Fill(context.getResults().initResponse());
  });
}

kj::Promise<void> Server::start(StartContext context) {
  std::string id;
  auto request =
      supervisor::DecodeRequest(context.getParams().getRequest());
  // Runs whether or not anybody asks for the result.
  auto reply = Submit(kj::mv(request), &id).eagerlyEvaluate(nullptr);
  auto results = context.getResults();
  results.setExecutionId(id);
  results.setExecution(kj::heap<Execution>(this, id, kj::mv(reply)));
  return kj::READY_NOW;
}

kj::Promise<void> Server::cancel(CancelContext context) {
  std::string id = context.getParams().getExecutionId();
  bool found = Cancel(id);
  KJ_LOG(INFO, "cancel", id, found);
  context.getResults().setFound(found);
  return kj::READY_NOW;
}

}  // namespace server
