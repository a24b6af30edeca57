#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Absolute or relative paths
// containing a slash are returned as they are if executable. Successful lookups
// are cached unless explicitly disabled; misses are never cached, so a
// program installed later is found by the next lookup.
// Returns an empty string if nothing executable is found.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
