#include "supervisor/output_collector.hpp"

#include <kj/async-io.h>

#include "gtest/gtest.h"

namespace {

using supervisor::CapturedOutput;
using supervisor::OutputCollector;

class OutputCollectorTest : public ::testing::Test {
 protected:
  // Writes out and err on two in-memory pipes, closing each once written,
  // and collects them. A writer blocked by a full collector is dropped.
  CapturedOutput Collect(int64_t max_bytes, const std::string& out,
                         const std::string& err) {
    auto out_pipe = kj::newOneWayPipe();
    auto err_pipe = kj::newOneWayPipe();
    OutputCollector collector(max_bytes);
    auto collected = collector.Collect(*out_pipe.in, *err_pipe.in);
    auto out_write = Write(kj::mv(out_pipe.out), out).eagerlyEvaluate(nullptr);
    auto err_write = Write(kj::mv(err_pipe.out), err).eagerlyEvaluate(nullptr);
    collected.wait(io_.waitScope);
    return collector.Freeze();
  }

  static kj::Promise<void> Write(kj::Own<kj::AsyncOutputStream> stream,
                                 const std::string& data) {
    if (data.empty()) return kj::READY_NOW;
    kj::AsyncOutputStream& ref = *stream;
    return ref.write(data.data(), data.size())
        .then([stream = kj::mv(stream)]() mutable { stream = nullptr; });
  }

  kj::AsyncIoContext io_ = kj::setupAsyncIo();
};

// NOLINTNEXTLINE
TEST_F(OutputCollectorTest, SeparateStreams) {
  CapturedOutput output = Collect(0, "to stdout", "to stderr");
  EXPECT_EQ(output.stdout_data, "to stdout");
  EXPECT_EQ(output.stderr_data, "to stderr");
  EXPECT_FALSE(output.stdout_truncated);
  EXPECT_FALSE(output.stderr_truncated);
}

// NOLINTNEXTLINE
TEST_F(OutputCollectorTest, ExactlyAtCapIsNotTruncated) {
  CapturedOutput output = Collect(5, "hello", "");
  EXPECT_EQ(output.stdout_data, "hello");
  EXPECT_FALSE(output.stdout_truncated);
}

// NOLINTNEXTLINE
TEST_F(OutputCollectorTest, OverCapIsTruncated) {
  std::string big(200000, 'x');
  CapturedOutput output = Collect(1000, big, "err");
  EXPECT_EQ(output.stdout_data, big.substr(0, 1000));
  EXPECT_TRUE(output.stdout_truncated);
  EXPECT_EQ(output.stderr_data, "err");
  EXPECT_FALSE(output.stderr_truncated);
}

// NOLINTNEXTLINE
TEST_F(OutputCollectorTest, Empty) {
  CapturedOutput output = Collect(10, "", "");
  EXPECT_EQ(output.stdout_data, "");
  EXPECT_EQ(output.stderr_data, "");
}

}  // namespace
