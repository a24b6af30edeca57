#include "util/misc.hpp"

#include <random>
#include <stdexcept>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string replaceAll(std::string s, const std::string& from,
                       const std::string& to) {
  if (from.empty()) return s;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

std::string randomHex(size_t n) {
  static const constexpr char* digits = "0123456789abcdef";
  thread_local std::random_device rd;
  std::uniform_int_distribution<int> dist(0, 255);
  std::string out;
  out.reserve(2 * n);
  for (size_t i = 0; i < n; i++) {
    int b = dist(rd);
    out += digits[b >> 4];
    out += digits[b & 0xf];
  }
  return out;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoi(std::string(p));
    } catch (const std::logic_error&) {
      return false;
    }
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt64(int64_t& var) {
  return [&var](kj::StringPtr p) {
    try {
      var = std::stoll(std::string(p));
    } catch (const std::logic_error&) {
      return false;
    }
    return var >= 0;
  };
};

}  // namespace util
