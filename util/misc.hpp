#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Replaces every occurrence of from in s with to.
std::string replaceAll(std::string s, const std::string& from,
                       const std::string& to);

// Returns n random bytes formatted as lowercase hex.
std::string randomHex(size_t n);

std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int& var);
std::function<bool(kj::StringPtr)> setInt64(int64_t& var);

}  // namespace util
#endif
