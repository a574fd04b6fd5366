#include "adminq/queue/queue_manager.hpp"
#include "adminq/storage/persistence.hpp"
#include "adminq/storage/recovery.hpp"

#include "test_utils.hpp"

#include <memory>

#include "gtest/gtest.h"

using namespace adminq;
using namespace adminq::test;

namespace {

constexpr int kMaxAttempts = 3;

}  // namespace

class RecoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    persistence_ = std::make_unique<Persistence>(db_.str());
    ASSERT_TRUE(persistence_->open().has_value());
  }

  void TearDown() override {
    persistence_.reset();
  }

  auto save(Task task) -> void {
    ASSERT_TRUE(persistence_->save_task(task).has_value());
  }

  TempPath db_;
  std::unique_ptr<Persistence> persistence_;
};

TEST_F(RecoveryTest, EmptyDatabase_RecoversNothing) {
  Recovery recovery(*persistence_, kMaxAttempts);

  auto result = recovery.recover();

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->tasks.empty());
  EXPECT_EQ(result->requeued, 0);
  EXPECT_EQ(result->cancelled, 0);
}

TEST_F(RecoveryTest, RunningTask_IsRequeued) {
  auto t = make_task("t1", "k", TaskState::Running, 1);
  t.attempt_count = 1;
  t.progress = 60;
  save(t);

  auto result = Recovery(*persistence_, kMaxAttempts).recover();

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->tasks.size(), 1u);
  EXPECT_EQ(result->requeued, 1);
  EXPECT_EQ(result->tasks[0].state, TaskState::Pending);
  EXPECT_EQ(result->tasks[0].progress, 0);
  EXPECT_EQ(result->tasks[0].attempt_count, 1);
  EXPECT_EQ(persistence_->get_task(task_id("t1"))->state, TaskState::Pending);
}

TEST_F(RecoveryTest, RunningTaskWithCancelRequest_IsCancelled) {
  auto t = make_task("t1", "k", TaskState::Running, 1);
  t.cancel_requested = true;
  save(t);

  auto result = Recovery(*persistence_, kMaxAttempts).recover();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->cancelled, 1);
  EXPECT_EQ(result->tasks[0].state, TaskState::Cancelled);
  EXPECT_TRUE(result->tasks[0].finished_at.has_value());
  EXPECT_EQ(persistence_->get_task(task_id("t1"))->state, TaskState::Cancelled);
}

TEST_F(RecoveryTest, RunningTaskOnLastAttempt_IsFailed) {
  auto t = make_task("t1", "k", TaskState::Running, 1);
  t.attempt_count = kMaxAttempts;
  save(t);

  auto result = Recovery(*persistence_, kMaxAttempts).recover();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->failed, 1);
  EXPECT_EQ(result->requeued, 0);
  ASSERT_EQ(result->tasks.size(), 1u);
  const auto& failed = result->tasks[0];
  EXPECT_EQ(failed.state, TaskState::Failed);
  EXPECT_EQ(failed.attempt_count, kMaxAttempts);
  EXPECT_TRUE(failed.finished_at.has_value());
  ASSERT_TRUE(failed.result.has_value());
  EXPECT_EQ((*failed.result)["error"], "attempt interrupted by shutdown");
  EXPECT_EQ((*failed.result)["attempts"], kMaxAttempts);
  EXPECT_EQ(persistence_->get_task(task_id("t1"))->state, TaskState::Failed);
}

TEST_F(RecoveryTest, ExhaustedTask_IsNotRunAgainAfterRestart) {
  auto t = make_task("last", "k", TaskState::Running, 1);
  t.attempt_count = 1;
  save(t);

  auto result = Recovery(*persistence_, 1).recover();
  ASSERT_TRUE(result.has_value());

  ScriptedExecutor executor;
  TaskStore store(persistence_.get());
  QueueOptions options;
  options.retry.max_attempts = 1;
  options.cancel_poll = 5ms;
  {
    QueueManager queue(executor, store, options);
    queue.restore(std::move(result->tasks));
    queue.start();
    sleep_ms(40ms);
    EXPECT_EQ(queue.status(task_id("last"))->state, TaskState::Failed);
    EXPECT_EQ(queue.status(task_id("last"))->attempt_count, 1);
    queue.stop();
  }
  executor.join();

  EXPECT_EQ(executor.start_count(), 0);
}

TEST_F(RecoveryTest, SettledTasks_AreUntouched) {
  save(make_task("p", "k", TaskState::Pending, 1));
  save(make_task("s", "k", TaskState::Succeeded, 2));
  save(make_task("f", "k", TaskState::Failed, 3));

  auto result = Recovery(*persistence_, kMaxAttempts).recover();

  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->tasks.size(), 3u);
  EXPECT_EQ(result->requeued, 0);
  EXPECT_EQ(result->tasks[0].state, TaskState::Pending);
  EXPECT_EQ(result->tasks[1].state, TaskState::Succeeded);
  EXPECT_EQ(result->tasks[2].state, TaskState::Failed);
}

TEST_F(RecoveryTest, RecoveredTasks_ResumeInQueue) {
  auto base = std::chrono::system_clock::now() - std::chrono::minutes(5);
  auto running = make_task("running", "repo", TaskState::Running, 1);
  running.created_at = base;
  running.attempt_count = 1;
  auto waiting = make_task("waiting", "repo", TaskState::Pending, 2);
  waiting.created_at = base + std::chrono::seconds(1);
  save(running);
  save(waiting);

  auto result = Recovery(*persistence_, kMaxAttempts).recover();
  ASSERT_TRUE(result.has_value());

  ScriptedExecutor executor;
  TaskStore store(persistence_.get());
  QueueOptions options;
  options.concurrency = 2;
  options.cancel_poll = 5ms;
  {
    QueueManager queue(executor, store, options);
    queue.restore(std::move(result->tasks));
    queue.start();

    ASSERT_TRUE(wait_until([&] {
      return queue.status(task_id("waiting"))->state == TaskState::Succeeded;
    }));
    EXPECT_EQ(queue.status(task_id("running"))->state, TaskState::Succeeded);
    EXPECT_EQ(queue.status(task_id("running"))->attempt_count, 2);
    queue.stop();
  }
  executor.join();

  auto starts = executor.starts();
  ASSERT_EQ(starts.size(), 2u);
  EXPECT_EQ(starts[0].key, "repo");
  EXPECT_EQ(persistence_->get_task(task_id("waiting"))->state,
            TaskState::Succeeded);
}
