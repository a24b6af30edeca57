#include "sandbox/main.hpp"

#include <fcntl.h>
#include <csignal>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include "capnp/snekbox.capnp.h"
#include "sandbox/unix.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {
kj::MainBuilder::Validity Main::Run() {
  // Nothing but the status message may reach the report pipe.
  if (fcntl(kReportFd, F_SETFD, FD_CLOEXEC) == -1) {
    return "the status pipe is not open";
  }
  // A SIGTERM sent to the whole group only has to stop the program.
  signal(SIGTERM, SIG_IGN);

  capnp::MallocMessageBuilder message;
  auto status = message.initRoot<capnproto::EngineStatus>();
  Unix::Run(config_, status);
  capnp::writeMessageToFd(kReportFd, message);
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Snekbox Sandbox (" + util::version + ")",
                         "Runs a command with resource limits and reports how "
                         "it ended on fd 3")
      .addOptionWithArg({'w', "workdir"}, util::setString(config_.scratch_dir),
                        "<DIR>", "Working directory of the command")
      .addOptionWithArg({"cpu-ms"}, util::setInt64(config_.cpu_limit_millis),
                        "<MS>", "CPU time limit")
      .addOptionWithArg({"memory-bytes"},
                        util::setInt64(config_.memory_limit_bytes), "<BYTES>",
                        "Resident memory limit")
      .addOptionWithArg({"processes"}, util::setInt64(config_.max_procs),
                        "<N>", "Limit on the processes of the user")
      .addOptionWithArg({"file-size-bytes"},
                        util::setInt64(config_.max_file_size_bytes),
                        "<BYTES>", "Largest file the command may write")
      .addOptionWithArg({"open-files"}, util::setInt64(config_.max_files),
                        "<N>", "Limit on open file descriptors")
      .addOption({"network"}, util::setBool(config_.allow_network),
                 "Keep the host network")
      .addOptionWithArg({'e', "env"},
                        [this](kj::StringPtr var) {
                          config_.env.emplace_back(var.cStr());
                          return true;
                        },
                        "<KEY=VALUE>", "Add a variable to the environment")
      .expectOneOrMoreArgs("<command>",
                           [this](kj::StringPtr arg) {
                             config_.command.emplace_back(arg.cStr());
                             return true;
                           })
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
