#include "supervisor/output_collector.hpp"

#include <algorithm>

namespace supervisor {
namespace {
const constexpr size_t kReadSize = 64 * 1024;
}  // namespace

kj::Promise<void> OutputCollector::Collect(kj::AsyncInputStream& out,
                                           kj::AsyncInputStream& err) {
  stdout_.buffer = kj::heapArray<kj::byte>(kReadSize);
  stderr_.buffer = kj::heapArray<kj::byte>(kReadSize);
  auto promises = kj::heapArrayBuilder<kj::Promise<void>>(2);
  promises.add(Drain(out, stdout_));
  promises.add(Drain(err, stderr_));
  return kj::joinPromises(promises.finish());
}

kj::Promise<void> OutputCollector::Drain(kj::AsyncInputStream& in,
                                         Stream& stream) {
  size_t want = kReadSize;
  if (max_bytes_ != 0) {
    size_t room = max_bytes_ - stream.data.size();
    if (room == 0) {
      return in.tryRead(stream.buffer.begin(), 1, 1).then([&stream](size_t n) {
        if (n > 0) stream.truncated = true;
      });
    }
    want = std::min(want, room);
  }
  return in.tryRead(stream.buffer.begin(), 1, want)
      .then([this, &in, &stream](size_t n) -> kj::Promise<void> {
        if (n == 0) return kj::READY_NOW;
        stream.data.append(stream.buffer.asChars().begin(), n);
        return Drain(in, stream);
      });
}

CapturedOutput OutputCollector::Freeze() {
  CapturedOutput output;
  output.stdout_data = std::move(stdout_.data);
  output.stdout_truncated = stdout_.truncated;
  output.stderr_data = std::move(stderr_.data);
  output.stderr_truncated = stderr_.truncated;
  return output;
}

}  // namespace supervisor
