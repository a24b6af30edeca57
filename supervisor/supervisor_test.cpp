#include "supervisor/supervisor.hpp"

#include <dirent.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <csignal>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace {

const char* test_tmpdir = "/tmp/snekbox_testdir";

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using namespace supervisor;  // NOLINT

std::vector<std::string> ListDir(const std::string& path) {
  std::vector<std::string> entries;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return entries;
  while (struct dirent* entry = readdir(dir)) {  // NOLINT
    std::string name = entry->d_name;
    if (name != "." && name != "..") entries.push_back(name);
  }
  closedir(dir);
  return entries;
}

class MockSandbox : public sandbox::Sandbox {
 public:
  MOCK_CONST_METHOD0(Name, const char*());
  MOCK_CONST_METHOD1(Command, std::vector<std::string>(
                                  const sandbox::IsolationConfig& config));
  MOCK_CONST_METHOD3(Interpret,
                     sandbox::Termination(int wait_status,
                                          const std::string& report,
                                          const sandbox::IsolationConfig&));
};

class SupervisorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    signal(SIGPIPE, SIG_IGN);
    Flags::sandbox_binary = SNEKBOX_BINARY;
    scratch_ = std::unique_ptr<util::TempDir>(new util::TempDir(test_tmpdir));
    engine_ = sandbox::Sandbox::Create("unix");
    ASSERT_TRUE(engine_);
    runtimes_.Add({"sh", {"sh", "-c", "{source}"}, ""});
    runtimes_.Add({"file", {"sh", "{source}"}, "main.sh"});
    limits_.ceilings.cpu_time_ms = 5000;
    limits_.ceilings.wall_time_ms = 5000;
    limits_.ceilings.memory_bytes = 256 << 20;
    limits_.ceilings.output_bytes = 1000;
    limits_.max_open_files = 64;
    limits_.max_file_size_bytes = 10 << 20;
    limits_.grace_ms = 200;
  }
  void TearDown() override { Flags::sandbox_binary = ""; }

  std::unique_ptr<Supervisor> Make(ExecutionRequest request,
                                   const sandbox::Sandbox& engine) {
    builder_ = std::unique_ptr<IsolationConfigBuilder>(
        new IsolationConfigBuilder(runtimes_, limits_, scratch_->Path()));
    return std::unique_ptr<Supervisor>(
        new Supervisor(io_, *builder_, engine, limits_, util::randomHex(16),
                       std::move(request)));
  }

  ExecutionResult Run(ExecutionRequest request) {
    auto supervisor = Make(std::move(request), *engine_);
    ExecutionResult result = supervisor->Run().wait(io_.waitScope);
    EXPECT_EQ(supervisor->GetState(), Supervisor::State::DONE);
    return result;
  }

  static ExecutionRequest Sh(const std::string& source) {
    ExecutionRequest request;
    request.runtime = "sh";
    request.source = source;
    return request;
  }

  static std::string TestBin(const std::string& name) {
    return util::File::JoinPath(SNEKBOX_TEST_BIN_DIR, name);
  }

  kj::AsyncIoContext io_ = kj::setupAsyncIo();
  std::unique_ptr<util::TempDir> scratch_;
  std::unique_ptr<sandbox::Sandbox> engine_;
  RuntimeTable runtimes_;
  ServerLimits limits_;
  std::unique_ptr<IsolationConfigBuilder> builder_;
};

// NOLINTNEXTLINE
TEST_F(SupervisorTest, Hello) {
  ExecutionResult result = Run(Sh("printf hello"));
  ASSERT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.outcome.get<outcome::Completed>().exit_code, 0);
  EXPECT_EQ(result.output.stdout_data, "hello");
  EXPECT_FALSE(result.output.stdout_truncated);
  EXPECT_EQ(result.output.stderr_data, "");
  EXPECT_THAT(result.warnings, IsEmpty());
  // The scratch path is gone.
  EXPECT_THAT(ListDir(scratch_->Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, ExitCodeAndStderr) {
  ExecutionResult result = Run(Sh("echo oops >&2; exit 3"));
  ASSERT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.outcome.get<outcome::Completed>().exit_code, 3);
  EXPECT_EQ(result.output.stderr_data, "oops\n");
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, SourceFile) {
  ExecutionRequest request = Sh("echo from a file; ls");
  request.runtime = "file";
  ExecutionResult result = Run(std::move(request));
  ASSERT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.output.stdout_data, "from a file\nmain.sh\n");
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, Stdin) {
  ExecutionRequest request = Sh("cat");
  request.stdin_data = std::string("some input");
  ExecutionResult result = Run(std::move(request));
  ASSERT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.output.stdout_data, "some input");
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, UnreadStdin) {
  ExecutionRequest request = Sh("exit 0");
  request.stdin_data = std::string(1 << 20, 'x');
  ExecutionResult result = Run(std::move(request));
  EXPECT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, TimedOut) {
  ExecutionRequest request = Sh("sleep 10");
  request.limits.wall_time_ms = 300;
  ExecutionResult result = Run(std::move(request));
  EXPECT_TRUE(result.outcome.is<outcome::TimedOut>())
      << OutcomeName(result.outcome);
  EXPECT_GE(result.duration_ms, 300);
  EXPECT_LT(result.duration_ms, 5000);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, TimedOutIgnoringTerm) {
  ExecutionRequest request = Sh("trap '' TERM; sleep 10");
  request.limits.wall_time_ms = 300;
  ExecutionResult result = Run(std::move(request));
  EXPECT_TRUE(result.outcome.is<outcome::TimedOut>())
      << OutcomeName(result.outcome);
  EXPECT_GE(result.duration_ms, 300 + limits_.grace_ms);
  EXPECT_LT(result.duration_ms, 5000);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, OutputTruncated) {
  ExecutionResult result = Run(Sh("head -c 5000 /dev/zero"));
  EXPECT_TRUE(result.outcome.is<outcome::OutputLimitExceeded>())
      << OutcomeName(result.outcome);
  EXPECT_TRUE(result.output.stdout_truncated);
  EXPECT_EQ(result.output.stdout_data.size(), 1000u);
  EXPECT_FALSE(result.output.stderr_truncated);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, OutputAtCap) {
  ExecutionResult result = Run(Sh("head -c 1000 /dev/zero"));
  EXPECT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
  EXPECT_FALSE(result.output.stdout_truncated);
  EXPECT_EQ(result.output.stdout_data.size(), 1000u);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, EndlessOutputTimesOutTruncated) {
  ExecutionRequest request = Sh("yes");
  request.limits.wall_time_ms = 300;
  ExecutionResult result = Run(std::move(request));
  EXPECT_TRUE(result.outcome.is<outcome::OutputLimitExceeded>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.output.stdout_data.size(), 1000u);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, Signaled) {
  ExecutionResult result = Run(Sh("kill -SEGV $$"));
  ASSERT_TRUE(result.outcome.is<outcome::Signaled>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.outcome.get<outcome::Signaled>().signal, SIGSEGV);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, MemoryLimit) {
  ExecutionRequest request = Sh("exec " + TestBin("malloc_arg1") + " 200");
  request.limits.memory_bytes = 32 << 20;
  ExecutionResult result = Run(std::move(request));
  ASSERT_TRUE(result.outcome.is<outcome::ResourceLimitExceeded>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.outcome.get<outcome::ResourceLimitExceeded>().resource,
            sandbox::Resource::MEMORY);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, MemoryLimitInGrandchild) {
  ExecutionRequest request = Sh(TestBin("malloc_arg1") + " 200; echo done");
  request.limits.memory_bytes = 32 << 20;
  ExecutionResult result = Run(std::move(request));
  ASSERT_TRUE(result.outcome.is<outcome::ResourceLimitExceeded>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.outcome.get<outcome::ResourceLimitExceeded>().resource,
            sandbox::Resource::MEMORY);
  EXPECT_EQ(result.output.stdout_data, "");
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, CpuLimit) {
  ExecutionRequest request = Sh("exec " + TestBin("busywait_arg1") + " 5");
  request.limits.cpu_time_ms = 1000;
  ExecutionResult result = Run(std::move(request));
  ASSERT_TRUE(result.outcome.is<outcome::ResourceLimitExceeded>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(result.outcome.get<outcome::ResourceLimitExceeded>().resource,
            sandbox::Resource::CPU_TIME);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, BackgroundProcessesAreKilled) {
  // Orphans are reparented to the test, so that their fate can be observed.
  ASSERT_EQ(prctl(PR_SET_CHILD_SUBREAPER, 1), 0);
  ExecutionResult result = Run(Sh("sleep 30 & echo $!"));
  ASSERT_TRUE(result.outcome.is<outcome::Completed>())
      << OutcomeName(result.outcome);
  pid_t orphan = std::stoi(result.output.stdout_data);
  int status = 0;
  ASSERT_EQ(waitpid(orphan, &status, 0), orphan);
  ASSERT_TRUE(WIFSIGNALED(status));
  EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, Cancel) {
  auto supervisor = Make(Sh("sleep 10"), *engine_);
  auto result_promise = supervisor->Run();
  EXPECT_EQ(supervisor->GetState(), Supervisor::State::RUNNING);
  io_.provider->getTimer()
      .afterDelay(100 * kj::MILLISECONDS)
      .then([&supervisor]() { supervisor->Cancel(); })
      .wait(io_.waitScope);
  ExecutionResult result = result_promise.wait(io_.waitScope);
  EXPECT_TRUE(result.outcome.is<outcome::Cancelled>())
      << OutcomeName(result.outcome);
  EXPECT_EQ(supervisor->GetState(), Supervisor::State::ABORTED);
  EXPECT_LT(result.duration_ms, 5000);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, CancelBeforeRun) {
  auto supervisor = Make(Sh("echo never"), *engine_);
  supervisor->Cancel();
  ExecutionResult result = supervisor->Run().wait(io_.waitScope);
  EXPECT_TRUE(result.outcome.is<outcome::Cancelled>());
  EXPECT_EQ(result.output.stdout_data, "");
  EXPECT_EQ(supervisor->GetState(), Supervisor::State::ABORTED);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, CancelAfterDoneIsIgnored) {
  auto supervisor = Make(Sh("exit 0"), *engine_);
  ExecutionResult result = supervisor->Run().wait(io_.waitScope);
  supervisor->Cancel();
  EXPECT_TRUE(result.outcome.is<outcome::Completed>());
  EXPECT_EQ(supervisor->GetState(), Supervisor::State::DONE);
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, InvalidConfigurationNeverStartsTheEngine) {
  MockSandbox engine;
  EXPECT_CALL(engine, Command(_)).Times(0);
  EXPECT_CALL(engine, Interpret(_, _, _)).Times(0);
  ExecutionRequest request = Sh("echo hi");
  request.runtime = "cobol";
  auto supervisor = Make(std::move(request), engine);
  ExecutionResult result = supervisor->Run().wait(io_.waitScope);
  ASSERT_TRUE(result.outcome.is<outcome::LaunchFailed>());
  EXPECT_THAT(result.outcome.get<outcome::LaunchFailed>().reason,
              HasSubstr("unknown runtime cobol"));
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, EngineMissing) {
  MockSandbox engine;
  EXPECT_CALL(engine, Name()).WillRepeatedly(::testing::Return("mock"));
  EXPECT_CALL(engine, Command(_))
      .WillOnce(::testing::Return(
          std::vector<std::string>{"/nonexistent/snekbox-engine"}));
  EXPECT_CALL(engine, Interpret(_, _, _)).Times(0);
  auto supervisor = Make(Sh("echo hi"), engine);
  ExecutionResult result = supervisor->Run().wait(io_.waitScope);
  ASSERT_TRUE(result.outcome.is<outcome::LaunchFailed>());
  EXPECT_THAT(result.outcome.get<outcome::LaunchFailed>().reason,
              ::testing::Not(HasSubstr("/nonexistent")));
  EXPECT_THAT(ListDir(scratch_->Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(SupervisorTest, SlotReleasedOnCompletion) {
  ExecutionPool pool(1);
  builder_ = std::unique_ptr<IsolationConfigBuilder>(
      new IsolationConfigBuilder(runtimes_, limits_, scratch_->Path()));
  Supervisor supervisor(io_, *builder_, *engine_, limits_, util::randomHex(16),
                        Sh("exit 0"), pool.Admit());
  EXPECT_EQ(pool.Running(), 1);
  supervisor.Run().wait(io_.waitScope);
  EXPECT_EQ(pool.Running(), 0);
}

}  // namespace
