#include "frontend/main.hpp"

#include <csignal>
#include <iostream>
#include <iterator>
#include <memory>
#include <system_error>

#include <capnp/ez-rpc.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/snekbox.capnp.h"
#include "sandbox/sandbox.hpp"
#include "supervisor/config_builder.hpp"
#include "supervisor/result_encoder.hpp"
#include "supervisor/runtime.hpp"
#include "supervisor/supervisor.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace frontend {
namespace {

// Reads path, or standard input if path is "-".
std::string ReadInput(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::ReadString(path);
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (Flags::verbose) kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);

  supervisor::ExecutionRequest request;
  request.runtime = runtime_;
  request.limits = limits_;
  try {
    request.source = ReadInput(source_path_);
    if (!stdin_path_.empty()) request.stdin_data = ReadInput(stdin_path_);
  } catch (const std::system_error& exc) {
    return kj::str(exc.what());
  }
  return local_ ? RunLocal(request) : RunRemote(request);
}

kj::MainBuilder::Validity Main::RunRemote(
    const supervisor::ExecutionRequest& req) {
  capnp::EzRpcClient client(server_);
  auto snekbox = client.getMain<capnproto::Snekbox>();
  auto eval = snekbox.evalRequest();
  supervisor::EncodeRequest(req, eval.initRequest());
  auto response = eval.send().wait(client.getWaitScope());
  std::cout << supervisor::ToJson(response.getResponse()) << std::endl;
  return true;
}

kj::MainBuilder::Validity Main::RunLocal(
    const supervisor::ExecutionRequest& req) {
  signal(SIGPIPE, SIG_IGN);
  std::unique_ptr<sandbox::Sandbox> engine =
      sandbox::Sandbox::Create(Flags::engine);
  if (!engine) {
    std::string known;
    for (const std::string& name : sandbox::Sandbox::Names()) {
      known += (known.empty() ? "" : ", ") + name;
    }
    return kj::str("no usable isolation engine named ", Flags::engine.c_str(),
                   " (known engines: ", known.c_str(), ")");
  }
  supervisor::RuntimeTable runtimes = supervisor::RuntimeTable::Builtin();
  std::string error_msg;
  if (!Flags::runtimes.empty() &&
      !supervisor::RuntimeTable::Load(Flags::runtimes, &runtimes,
                                      &error_msg)) {
    return kj::str("invalid runtimes file: ", error_msg.c_str());
  }
  supervisor::ServerLimits limits = supervisor::ServerLimits::FromFlags();

  std::unique_ptr<util::TempDir> scratch_root;
  try {
    scratch_root.reset(new util::TempDir(Flags::scratch_dir));
  } catch (const std::system_error& exc) {
    return kj::str("cannot create the scratch directory: ", exc.what());
  }
  supervisor::IsolationConfigBuilder builder(runtimes, limits,
                                             scratch_root->Path());
  if (!builder.Validate(req, &error_msg)) {
    capnp::MallocMessageBuilder message;
    auto response = message.initRoot<capnproto::Response>();
    supervisor::EncodeRejection(capnproto::Rejection::Reason::CONFIG_ERROR,
                                error_msg, response.initRejected());
    std::cout << supervisor::ToJson(response.asReader()) << std::endl;
    return true;
  }

  kj::AsyncIoContext io = kj::setupAsyncIo();
  supervisor::Supervisor execution(io, builder, *engine, limits,
                                   util::randomHex(16), req);
  supervisor::ExecutionResult result = execution.Run().wait(io.waitScope);
  std::cout << supervisor::ToJson(result) << std::endl;
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Snekbox Eval (" + util::version + ")",
                         "Runs a source file and prints the result as JSON")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log every execution event")
      .addOptionWithArg({'s', "server"}, util::setString(server_),
                        "<HOST:PORT>", "Server to send the source to")
      .addOptionWithArg({'r', "runtime"}, util::setString(runtime_), "<ID>",
                        "Runtime to run the source with")
      .addOptionWithArg({'i', "stdin"}, util::setString(stdin_path_), "<FILE>",
                        "File to feed on the program's stdin, - for stdin")
      .addOptionWithArg({"cpu-time-ms"}, util::setInt64(limits_.cpu_time_ms),
                        "<MS>", "CPU time limit")
      .addOptionWithArg({"wall-time-ms"}, util::setInt64(limits_.wall_time_ms),
                        "<MS>", "Wall time limit")
      .addOptionWithArg({"memory-bytes"},
                        util::setInt64(limits_.memory_bytes), "<BYTES>",
                        "Memory limit")
      .addOptionWithArg({"output-bytes"},
                        util::setInt64(limits_.output_bytes), "<BYTES>",
                        "Limit on each of stdout and stderr")
      .addOption({"local"}, util::setBool(local_),
                 "Run in this process instead of on a server")
      .addOptionWithArg({'e', "engine"}, util::setString(Flags::engine),
                        "<NAME>", "Isolation engine of --local")
      .addOptionWithArg({"runtimes"}, util::setString(Flags::runtimes),
                        "<FILE>", "Runtimes table of --local")
      .addOptionWithArg({'S', "scratch-dir"},
                        util::setString(Flags::scratch_dir), "<DIR>",
                        "Scratch directory of --local")
      .expectArg("<source>", util::setString(source_path_))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace frontend
