#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <string>
#include <unordered_map>

#include <kj/async-io.h>

#include "capnp/snekbox.capnp.h"
#include "sandbox/sandbox.hpp"
#include "supervisor/config_builder.hpp"
#include "supervisor/execution.hpp"
#include "supervisor/execution_pool.hpp"
#include "supervisor/runtime.hpp"
#include "supervisor/supervisor.hpp"

namespace server {

// How a request ended: either with an execution result or rejected before
// anything was started.
struct Reply {
  kj::Maybe<supervisor::ExecutionResult> result;
  capnproto::Rejection::Reason reason =
      capnproto::Rejection::Reason::CONFIG_ERROR;
  std::string message;

  static Reply Completed(supervisor::ExecutionResult result);
  static Reply Rejected(capnproto::Rejection::Reason reason,
                        std::string message);

  void Fill(capnproto::Response::Builder response) const;
};

class Server;

// Handle on a started execution.
class Execution : public capnproto::Execution::Server {
 public:
  Execution(Server* server, std::string id, kj::Promise<Reply> reply)
      : server_(*server), id_(std::move(id)), reply_(reply.fork()) {}

  kj::Promise<void> getResult(GetResultContext context) override;
  kj::Promise<void> cancel(CancelContext context) override;

 private:
  Server& server_;
  std::string id_;
  kj::ForkedPromise<Reply> reply_;
};

// The execution service. Every request is validated, admitted by the pool and
// run by its own supervisor on the event loop of io.
class Server : public capnproto::Snekbox::Server {
 public:
  Server(kj::AsyncIoContext& io, const sandbox::Sandbox& engine,
         const supervisor::RuntimeTable& runtimes,
         const supervisor::ServerLimits& limits, std::string scratch_root);

  kj::Promise<void> eval(EvalContext context) override;
  kj::Promise<void> start(StartContext context) override;
  kj::Promise<void> cancel(CancelContext context) override;

  // Cancels the running execution with the given id. Returns false if there
  // is none.
  bool Cancel(const std::string& execution_id);

  size_t Running() const { return running_.size(); }

 private:
  // Validates and admits request, and runs it. If it was admitted, sets
  // execution_id to the id it runs under.
  kj::Promise<Reply> Submit(supervisor::ExecutionRequest request,
                            std::string* execution_id);

  std::string NewId() const;

  kj::AsyncIoContext& io_;
  const sandbox::Sandbox& engine_;
  supervisor::ServerLimits limits_;
  supervisor::IsolationConfigBuilder builder_;
  supervisor::ExecutionPool pool_;
  std::unordered_map<std::string, supervisor::Supervisor*> running_;
};

}  // namespace server

#endif
