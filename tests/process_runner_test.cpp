#include "adminq/executor/process_runner.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace adminq;
using namespace adminq::test;

namespace {

auto in(std::chrono::milliseconds ms) -> std::chrono::steady_clock::time_point {
  return std::chrono::steady_clock::now() + ms;
}

auto spec_of(std::vector<std::string> argv) -> ProcessSpec {
  ProcessSpec spec;
  spec.argv = std::move(argv);
  return spec;
}

}  // namespace

TEST(ProcessRunnerTest, Echo_CapturesOutput) {
  auto result = run_process(spec_of({"echo", "hello", "world"}), in(5000ms), {});

  EXPECT_TRUE(result.succeeded());
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.output, "hello world\n");
}

TEST(ProcessRunnerTest, NonZeroExit_IsReported) {
  auto result = run_process(spec_of({"sh", "-c", "echo oops >&2; exit 3"}),
                            in(5000ms), {});

  EXPECT_FALSE(result.succeeded());
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.output, "oops\n");
  EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, MissingBinary_Exits127) {
  auto result = run_process(spec_of({"/nonexistent/adminq-binary"}), in(5000ms), {});

  EXPECT_EQ(result.exit_code, 127);
  EXPECT_TRUE(result.error.empty());
}

TEST(ProcessRunnerTest, EmptyArgv_IsError) {
  auto result = run_process(ProcessSpec{}, in(5000ms), {});

  EXPECT_FALSE(result.error.empty());
  EXPECT_FALSE(result.succeeded());
}

TEST(ProcessRunnerTest, Deadline_KillsProcess) {
  auto started = std::chrono::steady_clock::now();
  auto result = run_process(spec_of({"sleep", "10"}), in(200ms), {});

  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.succeeded());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(ProcessRunnerTest, ShouldStop_CancelsProcess) {
  std::atomic<bool> stop{false};
  ProcessHooks hooks;
  hooks.should_stop = [&] { return stop.load(); };
  hooks.on_spawn = [&](pid_t) { stop = true; };

  auto result = run_process(spec_of({"sleep", "10"}), in(10000ms), hooks);

  EXPECT_TRUE(result.cancelled);
  EXPECT_FALSE(result.timed_out);
  EXPECT_FALSE(result.succeeded());
}

TEST(ProcessRunnerTest, OnLine_SplitsOnNewlinesAndCarriageReturns) {
  std::vector<std::string> lines;
  ProcessHooks hooks;
  hooks.on_line = [&](std::string_view line) { lines.emplace_back(line); };

  auto result = run_process(spec_of({"printf", "a\\nb\\r c\\n\\ntail"}),
                            in(5000ms), hooks);

  ASSERT_TRUE(result.succeeded());
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0], "a");
  EXPECT_EQ(lines[1], "b");
  EXPECT_EQ(lines[2], " c");
  EXPECT_EQ(lines[3], "tail");
}

TEST(ProcessRunnerTest, Env_IsAddedToChild) {
  auto spec = spec_of({"sh", "-c", "echo $ADMINQ_TEST_VALUE"});
  spec.env.emplace_back("ADMINQ_TEST_VALUE", "from-test");

  auto result = run_process(spec, in(5000ms), {});

  EXPECT_EQ(result.output, "from-test\n");
}

TEST(ProcessRunnerTest, WorkingDir_IsApplied) {
  auto spec = spec_of({"pwd"});
  spec.working_dir = "/";

  auto result = run_process(spec, in(5000ms), {});

  EXPECT_EQ(result.output, "/\n");
}

TEST(ProcessRunnerTest, FormatCommand_JoinsArgs) {
  EXPECT_EQ(format_command({"docker", "push", "repo:v1"}), "docker push repo:v1");
  EXPECT_EQ(format_command({}), "");
}
