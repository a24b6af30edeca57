#ifndef SUPERVISOR_RUNTIME_HPP
#define SUPERVISOR_RUNTIME_HPP

#include <map>
#include <string>
#include <vector>

#include <kj/common.h>

namespace supervisor {

// Placeholder replaced, in a runtime command, by the source text or by the
// name of the file the source was written to.
static const constexpr char* kSourcePlaceholder = "{source}";

struct Runtime {
  std::string id;
  std::vector<std::string> command;
  // If not empty, the source is written to this file in the scratch path and
  // the placeholder expands to its name.
  std::string source_file;
};

// The runtimes requests can ask for, by id.
class RuntimeTable {
 public:
  // python3 (source passed with -c) and sh (source written to main.sh).
  static RuntimeTable Builtin();

  // Parses the JSON form of a RuntimeConfig. On error, returns false and sets
  // error_msg.
  static bool FromJson(const std::string& json, RuntimeTable* table,
                       std::string* error_msg);

  // Same as FromJson, reading the given file.
  static bool Load(const std::string& path, RuntimeTable* table,
                   std::string* error_msg);

  // Adds or replaces a runtime.
  void Add(Runtime runtime);

  kj::Maybe<const Runtime&> Find(const std::string& id) const;

  std::vector<std::string> Ids() const;

 private:
  std::map<std::string, Runtime> runtimes_;
};

}  // namespace supervisor

#endif
