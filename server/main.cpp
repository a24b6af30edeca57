#include "server/main.hpp"

#include <algorithm>
#include <csignal>
#include <memory>
#include <system_error>
#include <thread>

#include <capnp/rpc-twoparty.h>
#include <kj/debug.h>

#include "sandbox/sandbox.hpp"
#include "server/server.hpp"
#include "supervisor/runtime.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
namespace {

// True if /proc/swaps lists at least one swap area.
bool SwapEnabled() {
  std::string swaps;
  try {
    swaps = util::File::ReadString("/proc/swaps");
  } catch (const std::system_error& exc) {
    KJ_LOG(WARNING, "cannot read /proc/swaps", exc.what());
    return false;
  }
  // The first line is the header.
  auto lines = util::split(swaps, '\n');
  size_t areas = 0;
  for (size_t i = 1; i < lines.size(); i++) {
    if (!lines[i].empty()) areas++;
  }
  return areas > 0;
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (Flags::verbose) kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  // Writes on a pipe whose program is gone must fail, not kill the server.
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
  if (std::string(engine->Name()) == "nsjail" && SwapEnabled()) {
    KJ_LOG(WARNING,
           "swap is enabled, the memory limit of executions may be exceeded "
           "by swapping");
  }

  supervisor::RuntimeTable runtimes = supervisor::RuntimeTable::Builtin();
  if (!Flags::runtimes.empty()) {
    std::string error_msg;
    if (!supervisor::RuntimeTable::Load(Flags::runtimes, &runtimes,
                                        &error_msg)) {
      return kj::str("invalid runtimes file: ", error_msg.c_str());
    }
  }

  supervisor::ServerLimits limits = supervisor::ServerLimits::FromFlags();
  if (limits.max_concurrent_executions == 0) {
    limits.max_concurrent_executions =
        std::max(1u, std::thread::hardware_concurrency());
  }
  try {
    util::File::MakeDirs(Flags::scratch_dir);
  } catch (const std::system_error& exc) {
    return kj::str("cannot create the scratch directory: ", exc.what());
  }

  kj::AsyncIoContext io = kj::setupAsyncIo();
  capnp::TwoPartyServer rpc(kj::heap<Server>(io, *engine, runtimes, limits,
                                             Flags::scratch_dir));
  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address, Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  KJ_LOG(INFO, "listening", Flags::listen_address, listener->getPort(),
         engine->Name(), limits.max_concurrent_executions);
  rpc.listen(*listener).wait(io.waitScope);
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Snekbox Server (" + util::version + ")",
                         "Runs untrusted code in an isolation engine and "
                         "serves the results over Cap'n Proto RPC")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log every execution event")
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({'S', "scratch-dir"},
                        util::setString(Flags::scratch_dir), "<DIR>",
                        "Directory where the scratch paths are created")
      .addOption({"keep-scratch"}, util::setBool(Flags::keep_scratch),
                 "Do not remove scratch paths, for debugging")
      .addOptionWithArg({'e', "engine"}, util::setString(Flags::engine),
                        "<NAME>", "Isolation engine: auto, unix or nsjail")
      .addOptionWithArg({"sandbox-binary"},
                        util::setString(Flags::sandbox_binary), "<PATH>",
                        "Binary providing the sandbox subcommand of the unix "
                        "engine, this executable by default")
      .addOptionWithArg({"nsjail"}, util::setString(Flags::nsjail), "<PATH>",
                        "nsjail executable")
      .addOptionWithArg({"nsjail-config"},
                        util::setString(Flags::nsjail_config), "<FILE>",
                        "Base configuration file passed to nsjail")
      .addOptionWithArg({"seccomp-policy"},
                        util::setString(Flags::seccomp_policy), "<FILE>",
                        "Seccomp policy file passed to nsjail")
      .addOptionWithArg({'r', "runtimes"}, util::setString(Flags::runtimes),
                        "<FILE>", "JSON file with the table of runtimes")
      .addOptionWithArg({"grace-ms"}, util::setInt64(Flags::grace_ms), "<MS>",
                        "Time between SIGTERM and SIGKILL of a process group")
      .addOptionWithArg({"max-cpu-time-ms"},
                        util::setInt64(Flags::max_cpu_time_ms), "<MS>",
                        "CPU time ceiling, 0 for none")
      .addOptionWithArg({"max-wall-time-ms"},
                        util::setInt64(Flags::max_wall_time_ms), "<MS>",
                        "Wall time ceiling, 0 for none")
      .addOptionWithArg({"max-memory-bytes"},
                        util::setInt64(Flags::max_memory_bytes), "<BYTES>",
                        "Memory ceiling, 0 for none")
      .addOptionWithArg({"max-output-bytes"},
                        util::setInt64(Flags::max_output_bytes), "<BYTES>",
                        "Ceiling on each of stdout and stderr, 0 for none")
      .addOptionWithArg({"max-processes"},
                        util::setInt64(Flags::max_processes), "<N>",
                        "Processes an execution may create, 0 for no limit")
      .addOptionWithArg({"max-file-size-bytes"},
                        util::setInt64(Flags::max_file_size_bytes), "<BYTES>",
                        "Largest file an execution may write, 0 for no limit")
      .addOptionWithArg({"max-open-files"},
                        util::setInt64(Flags::max_open_files), "<N>",
                        "Open files of an execution, 0 for no limit")
      .addOptionWithArg({'j', "max-concurrent-executions"},
                        util::setInt(Flags::max_concurrent_executions), "<N>",
                        "Executions running at the same time, 0 for the "
                        "number of cores")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
