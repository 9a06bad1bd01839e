#include "taskweave/process/subprocess.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <string>

#include "gtest/gtest.h"

using namespace taskweave;
using namespace taskweave::test;
using namespace std::chrono_literals;

TEST(SubprocessTest, CapturesStdoutAndExitCode) {
  auto r = run_process({"sh", "-c", "echo hello; exit 3"});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->exit_code, 3);
  EXPECT_EQ(r->stdout_output, "hello\n");
  EXPECT_FALSE(r->timed_out);
}

TEST(SubprocessTest, CapturesStderrSeparately) {
  auto r = run_process({"sh", "-c", "echo out; echo err >&2"});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->stdout_output, "out\n");
  EXPECT_EQ(r->stderr_output, "err\n");
}

TEST(SubprocessTest, ArgumentsAreNotShellInterpreted) {
  auto r = run_process({"echo", "$HOME; rm -rf /", "a  b"});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->stdout_output, "$HOME; rm -rf / a  b\n");
}

TEST(SubprocessTest, FeedsStdin) {
  ProcessOptions options;
  options.stdin_data = "line one\nline two\n";
  auto r = run_process({"cat"}, options);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->stdout_output, "line one\nline two\n");
}

TEST(SubprocessTest, UnreadStdinDoesNotKillParent) {
  ProcessOptions options;
  options.stdin_data = std::string(1 << 20, 'x');
  auto r = run_process({"true"}, options);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->exit_code, 0);
}

TEST(SubprocessTest, UsesWorkingDirectory) {
  TempDir dir;
  ProcessOptions options;
  options.working_dir = dir.path().string();
  auto r = run_process({"pwd", "-P"}, options);
  ASSERT_TRUE(r.has_value());
  auto expected = std::filesystem::canonical(dir.path()).string() + "\n";
  EXPECT_EQ(r->stdout_output, expected);
}

TEST(SubprocessTest, AddsEnvironment) {
  ProcessOptions options;
  options.env = {{"TASKWEAVE_TEST_VAR", "value 42"}};
  auto r = run_process({"sh", "-c", "printf %s \"$TASKWEAVE_TEST_VAR\""},
                       options);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->stdout_output, "value 42");
}

TEST(SubprocessTest, TimeoutKillsProcessGroup) {
  ProcessOptions options;
  options.timeout = 200ms;
  auto start = std::chrono::steady_clock::now();
  auto r = run_process({"sh", "-c", "sleep 30 & sleep 30"}, options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->timed_out);
  EXPECT_LT(elapsed, 10s);
}

TEST(SubprocessTest, TimeoutAppliesAfterChildClosesOutput) {
  ProcessOptions options;
  options.timeout = 200ms;
  auto start = std::chrono::steady_clock::now();
  auto r = run_process({"sh", "-c", "exec >/dev/null 2>&1; sleep 30"}, options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->timed_out);
  EXPECT_EQ(r->exit_code, 128 + 9);
  EXPECT_LT(elapsed, 10s);
}

TEST(SubprocessTest, ChildExitingAfterClosingOutputIsNotTimedOut) {
  ProcessOptions options;
  options.timeout = 5s;
  auto r = run_process({"sh", "-c", "exec >/dev/null 2>&1; sleep 0.1; exit 4"},
                       options);
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->timed_out);
  EXPECT_EQ(r->exit_code, 4);
}

TEST(SubprocessTest, OutputPastLimitIsTruncatedAndFlagged) {
  ProcessOptions options;
  options.max_output = 1000;
  auto r = run_process({"sh", "-c", "head -c 5000 /dev/zero | tr '\\0' a"},
                       options);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->exit_code, 0);
  EXPECT_TRUE(r->truncated);
  EXPECT_EQ(r->stdout_output, std::string(1000, 'a'));
}

TEST(SubprocessTest, DefaultLimitCapsLargeOutput) {
  auto r = run_process({"head", "-c", std::to_string(MAX_OUTPUT_SIZE + 4096),
                        "/dev/zero"});
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->truncated);
  EXPECT_EQ(r->stdout_output.size(), MAX_OUTPUT_SIZE);
}

TEST(SubprocessTest, ZeroLimitCapturesEverything) {
  ProcessOptions options;
  options.max_output = 0;
  auto r = run_process({"head", "-c", std::to_string(MAX_OUTPUT_SIZE + 4096),
                        "/dev/zero"},
                       options);
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->truncated);
  EXPECT_EQ(r->stdout_output.size(), MAX_OUTPUT_SIZE + 4096);
}

TEST(SubprocessTest, SignalledChildReports128PlusSignal) {
  auto r = run_process({"sh", "-c", "kill -9 $$"});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->exit_code, 128 + 9);
}

TEST(SubprocessTest, MissingProgramIsSpawnFailure) {
  auto r = run_process({"taskweave-no-such-program-xyz"});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::SpawnFailed));
}

TEST(SubprocessTest, EmptyArgvIsInvalid) {
  auto r = run_process({});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
}

TEST(SubprocessTest, OnSpawnReceivesPid) {
  pid_t seen = 0;
  ProcessOptions options;
  options.on_spawn = [&](pid_t pid) { seen = pid; };
  auto r = run_process({"true"}, options);
  ASSERT_TRUE(r.has_value());
  EXPECT_GT(seen, 0);
}
