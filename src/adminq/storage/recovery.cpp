#include "adminq/storage/recovery.hpp"

#include "adminq/util/log.hpp"

#include <chrono>
#include <format>

namespace adminq {

Recovery::Recovery(Persistence& persistence, int max_attempts)
    : persistence_(persistence), max_attempts_(max_attempts) {
}

auto Recovery::recover() -> Result<RecoveryResult> {
  RecoveryResult result;

  auto loaded = persistence_.load_tasks();
  if (!loaded) {
    log::error("Failed to load tasks for recovery");
    return fail(loaded.error());
  }
  log::info("Found {} retained tasks", loaded->size());

  for (auto& task : *loaded) {
    if (task.state == TaskState::Running) {
      auto now = std::chrono::system_clock::now();
      Result<void> moved;
      if (task.cancel_requested) {
        log::info("Task {} had a pending cancel request, marking cancelled",
                  task.id);
        moved = task.transition_to(TaskState::Cancelled);
        task.finished_at = now;
        task.current_step = "cancelled";
        task.add_log("Cancelled during restart recovery");
        result.cancelled++;
      } else if (task.attempt_count >= max_attempts_) {
        log::warn("Task {} was on its last attempt when interrupted, marking failed",
                  task.id);
        moved = task.transition_to(TaskState::Failed);
        task.finished_at = now;
        task.current_step = "failed";
        task.result = interrupted_failure(task.attempt_count);
        task.add_log(std::format(
            "Attempt {} interrupted by shutdown; no attempts left",
            task.attempt_count));
        result.failed++;
      } else {
        log::info("Task {} was running during shutdown, returning to queue",
                  task.id);
        moved = task.transition_to(TaskState::Pending);
        task.progress = 0;
        task.current_step = "queued";
        task.add_log("Recovered after restart, re-queued");
        result.requeued++;
      }
      if (!moved) {
        log::error("Task {} could not leave Running: {}", task.id,
                   moved.error().message());
        return fail(moved.error());
      }
      ++task.revision;

      if (auto r = persistence_.save_task(task); !r) {
        log::warn("Failed to update task {} during recovery: {}", task.id,
                  r.error().message());
      }
    }
    result.tasks.push_back(std::move(task));
  }

  log::info(
      "Recovery complete: {} tasks loaded, {} re-queued, {} cancelled, {} failed",
      result.tasks.size(), result.requeued, result.cancelled, result.failed);

  return ok(std::move(result));
}

}  // namespace adminq
