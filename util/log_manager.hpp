#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <mutex>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats kj log messages and recoverable exceptions on stderr or on the file
// named by --logfile. Colours are only used when writing to a terminal. Stack
// traces of exceptions are printed when --verbose is set.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  bool colors_;
  std::mutex mutex_;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
