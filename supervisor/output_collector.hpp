#ifndef SUPERVISOR_OUTPUT_COLLECTOR_HPP
#define SUPERVISOR_OUTPUT_COLLECTOR_HPP

#include <cstdint>
#include <string>

#include <kj/array.h>
#include <kj/async-io.h>

#include "supervisor/execution.hpp"

namespace supervisor {

// Reads stdout and stderr of an execution into separate buffers, each holding
// at most max_bytes. Once a buffer is full, one more byte is read from its
// stream to tell whether the stream had more to give; after that the stream
// is no longer read, so a program that keeps writing blocks instead of being
// killed.
class OutputCollector {
 public:
  // A max_bytes of 0 means no limit.
  explicit OutputCollector(int64_t max_bytes) : max_bytes_(max_bytes) {}

  // Resolves when both streams reached end of file or their cap. The streams
  // must outlive the returned promise.
  kj::Promise<void> Collect(kj::AsyncInputStream& out,
                            kj::AsyncInputStream& err);

  bool Truncated() const { return stdout_.truncated || stderr_.truncated; }

  // Moves the buffers out. Any pending Collect promise must have been
  // dropped or resolved.
  CapturedOutput Freeze();

 private:
  struct Stream {
    std::string data;
    bool truncated = false;
    kj::Array<kj::byte> buffer;
  };

  kj::Promise<void> Drain(kj::AsyncInputStream& in, Stream& stream);

  int64_t max_bytes_;
  Stream stdout_;
  Stream stderr_;
};

}  // namespace supervisor

#endif
