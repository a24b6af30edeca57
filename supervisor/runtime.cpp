#include "supervisor/runtime.hpp"

#include <system_error>

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/snekbox.capnp.h"
#include "util/file.hpp"

namespace supervisor {

RuntimeTable RuntimeTable::Builtin() {
  RuntimeTable table;
  // -I isolates from the user site and environment, -q skips the banner, -u
  // leaves stdout and stderr unbuffered.
  table.Add({"python3", {"python3", "-Iqu", "-c", kSourcePlaceholder}, ""});
  table.Add({"sh", {"sh", kSourcePlaceholder}, "main.sh"});
  return table;
}

bool RuntimeTable::FromJson(const std::string& json, RuntimeTable* table,
                            std::string* error_msg) {
  RuntimeTable parsed;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                capnp::JsonCodec codec;
                capnp::MallocMessageBuilder message;
                auto config = message.initRoot<capnproto::RuntimeConfig>();
                codec.decode(kj::StringPtr(json.c_str()), config);
                for (auto runtime : config.getRuntimes()) {
                  Runtime r;
                  r.id = runtime.getId();
                  for (auto arg : runtime.getCommand()) {
                    r.command.emplace_back(arg.cStr());
                  }
                  r.source_file = runtime.getSourceFile();
                  parsed.Add(std::move(r));
                }
              })) {
    *error_msg = exception->getDescription().cStr();
    return false;
  }
  for (const auto& entry : parsed.runtimes_) {
    const Runtime& runtime = entry.second;
    if (runtime.id.empty()) {
      *error_msg = "runtime without an id";
      return false;
    }
    if (runtime.command.empty()) {
      *error_msg = "runtime " + runtime.id + " has an empty command";
      return false;
    }
    if (runtime.source_file.find('/') != std::string::npos ||
        runtime.source_file == "." || runtime.source_file == "..") {
      *error_msg = "runtime " + runtime.id + " has an invalid source file";
      return false;
    }
  }
  *table = std::move(parsed);
  return true;
}

bool RuntimeTable::Load(const std::string& path, RuntimeTable* table,
                        std::string* error_msg) {
  std::string json;
  try {
    json = util::File::ReadString(path);
  } catch (const std::system_error& exc) {
    *error_msg = exc.what();
    return false;
  }
  return FromJson(json, table, error_msg);
}

void RuntimeTable::Add(Runtime runtime) {
  std::string id = runtime.id;
  runtimes_[id] = std::move(runtime);
}

kj::Maybe<const Runtime&> RuntimeTable::Find(const std::string& id) const {
  auto it = runtimes_.find(id);
  if (it == runtimes_.end()) return nullptr;
  return it->second;
}

std::vector<std::string> RuntimeTable::Ids() const {
  std::vector<std::string> ids;
  for (const auto& entry : runtimes_) ids.push_back(entry.first);
  return ids;
}

}  // namespace supervisor
