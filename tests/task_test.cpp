#include "adminq/queue/retry_policy.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/storage/state_strings.hpp"

#include <string>

#include "gtest/gtest.h"

using namespace adminq;
using namespace std::chrono_literals;

TEST(TaskStateTest, TerminalStates) {
  EXPECT_FALSE(is_terminal(TaskState::Pending));
  EXPECT_FALSE(is_terminal(TaskState::Running));
  EXPECT_TRUE(is_terminal(TaskState::Succeeded));
  EXPECT_TRUE(is_terminal(TaskState::Failed));
  EXPECT_TRUE(is_terminal(TaskState::Cancelled));
}

TEST(TaskStateTest, Transitions_FollowStateMachine) {
  EXPECT_TRUE(can_transition(TaskState::Pending, TaskState::Running));
  EXPECT_TRUE(can_transition(TaskState::Pending, TaskState::Cancelled));
  EXPECT_FALSE(can_transition(TaskState::Pending, TaskState::Succeeded));

  EXPECT_TRUE(can_transition(TaskState::Running, TaskState::Pending));
  EXPECT_TRUE(can_transition(TaskState::Running, TaskState::Succeeded));
  EXPECT_TRUE(can_transition(TaskState::Running, TaskState::Failed));
  EXPECT_TRUE(can_transition(TaskState::Running, TaskState::Cancelled));
}

TEST(TaskStateTest, TransitionTo_RejectsEdgesOutsideStateMachine) {
  Task t;
  ASSERT_TRUE(t.transition_to(TaskState::Running).has_value());
  EXPECT_EQ(t.state, TaskState::Running);
  ASSERT_TRUE(t.transition_to(TaskState::Succeeded).has_value());

  auto r = t.transition_to(TaskState::Pending);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidTransition));
  EXPECT_EQ(t.state, TaskState::Succeeded);

  Task pending;
  EXPECT_FALSE(pending.transition_to(TaskState::Failed).has_value());
  EXPECT_EQ(pending.state, TaskState::Pending);
}

TEST(TaskStateTest, TerminalStates_HaveNoExits) {
  for (auto from : {TaskState::Succeeded, TaskState::Failed, TaskState::Cancelled}) {
    for (auto to : {TaskState::Pending, TaskState::Running, TaskState::Succeeded,
                    TaskState::Failed, TaskState::Cancelled}) {
      EXPECT_FALSE(can_transition(from, to))
          << task_state_name(from) << " -> " << task_state_name(to);
    }
  }
}

TEST(StateStringsTest, StateNames_Parse) {
  EXPECT_STREQ(task_state_name(TaskState::Cancelled), "cancelled");
  EXPECT_EQ(parse_task_state("running"), TaskState::Running);
  EXPECT_FALSE(parse_task_state("done").has_value());
}

TEST(StateStringsTest, KindNames_Parse) {
  EXPECT_STREQ(task_kind_name(TaskKind::DockerPush), "docker_push");
  EXPECT_EQ(parse_task_kind("ollama_run"), TaskKind::OllamaRun);
  EXPECT_FALSE(parse_task_kind("push").has_value());
}

TEST(TaskLogTest, AddLog_TruncatesLongLines) {
  Task t;
  t.add_log(std::string(limits::kMaxLogLineLength + 100, 'x'));

  ASSERT_EQ(t.logs.size(), 1u);
  EXPECT_EQ(t.logs[0].message.size(), limits::kMaxLogLineLength);
}

TEST(TaskLogTest, AddLog_KeepsNewestLines) {
  Task t;
  for (std::size_t i = 0; i < limits::kMaxTaskLogLines + 10; ++i) {
    t.add_log(std::to_string(i));
  }

  ASSERT_EQ(t.logs.size(), limits::kMaxTaskLogLines);
  EXPECT_EQ(t.logs.front().message, "10");
  EXPECT_EQ(t.logs.back().message,
            std::to_string(limits::kMaxTaskLogLines + 9));
}

TEST(TaskTest, Duration_UnsetBeforeStart) {
  Task t;
  EXPECT_FALSE(t.duration().has_value());

  auto start = std::chrono::system_clock::now();
  t.started_at = start;
  t.finished_at = start + 1500ms;
  ASSERT_TRUE(t.duration().has_value());
  EXPECT_EQ(t.duration()->count(), 1500);
}

TEST(RetryPolicyTest, Backoff_DoublesPerAttempt) {
  RetryPolicy p{.max_attempts = 5, .base_delay = 100ms, .max_delay = 10s};

  EXPECT_EQ(p.backoff(1), 100ms);
  EXPECT_EQ(p.backoff(2), 200ms);
  EXPECT_EQ(p.backoff(3), 400ms);
  EXPECT_EQ(p.backoff(4), 800ms);
}

TEST(RetryPolicyTest, Backoff_IsCapped) {
  RetryPolicy p{.max_attempts = 100, .base_delay = 1000ms, .max_delay = 5000ms};

  EXPECT_EQ(p.backoff(3), 4000ms);
  EXPECT_EQ(p.backoff(4), 5000ms);
  EXPECT_EQ(p.backoff(64), 5000ms);
  EXPECT_EQ(p.backoff(1000), 5000ms);
}

TEST(RetryPolicyTest, Backoff_ZeroBeforeFirstAttempt) {
  RetryPolicy p;
  EXPECT_EQ(p.backoff(0), 0ms);
  EXPECT_EQ(p.backoff(-3), 0ms);
}

TEST(RetryPolicyTest, Exhausted_AtMaxAttempts) {
  RetryPolicy p{.max_attempts = 3, .base_delay = 1ms, .max_delay = 1ms};

  EXPECT_FALSE(p.exhausted(1));
  EXPECT_FALSE(p.exhausted(2));
  EXPECT_TRUE(p.exhausted(3));
  EXPECT_TRUE(p.exhausted(4));
}
