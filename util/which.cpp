#include "util/which.hpp"
#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::mutex cmd_cache_mutex;
std::unordered_map<std::string, std::string> cmd_cache;
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.empty()) return "";
  if (cmd.find('/') != std::string::npos) {
    return File::IsExecutable(cmd) ? cmd : "";
  }

  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (File::IsExecutable(fullpath)) return cmd_cache[cmd] = fullpath;
  }
  return "";
}

}  // namespace util
