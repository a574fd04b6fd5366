#include "adminq/cli/commands.hpp"
#include "adminq/queue/task_store.hpp"
#include "adminq/storage/persistence.hpp"
#include "adminq/storage/state_strings.hpp"

#include <chrono>
#include <format>
#include <print>

namespace adminq::cli {

namespace {

auto print_task(const Task& task) -> void {
  std::println("Task:     {}", task.id);
  std::println("Kind:     {}", task_kind_name(task.kind));
  std::println("Key:      {}", task.key);
  std::println("State:    {}", task_state_name(task.state));
  std::println("Attempts: {}", task.attempt_count);
  std::println("Progress: {}% ({})", task.progress, task.current_step);
  std::println("Created:  {:%Y-%m-%d %H:%M:%S}",
               std::chrono::floor<std::chrono::seconds>(task.created_at));
  if (task.started_at) {
    std::println("Started:  {:%Y-%m-%d %H:%M:%S}",
                 std::chrono::floor<std::chrono::seconds>(*task.started_at));
  }
  if (task.finished_at) {
    std::println("Finished: {:%Y-%m-%d %H:%M:%S}",
                 std::chrono::floor<std::chrono::seconds>(*task.finished_at));
  }
  if (auto d = task.duration()) {
    std::println("Duration: {:.1f}s", static_cast<double>(d->count()) / 1000.0);
  }
  if (task.cancel_requested) {
    std::println("Cancel requested");
  }
  if (task.result) {
    std::println("Result:   {}", task.result->dump());
  }
  if (!task.logs.empty()) {
    std::println("\nLog:");
    for (const auto& entry : task.logs) {
      std::println("  {:%H:%M:%S} {}",
                   std::chrono::floor<std::chrono::seconds>(entry.at),
                   entry.message);
    }
  }
}

}  // namespace

auto cmd_status(const StatusOptions& opts) -> int {
  Persistence db(opts.db_file);

  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}", r.error().message());
    return 1;
  }

  if (!opts.task_id.empty()) {
    auto task = db.get_task(TaskId{opts.task_id});
    if (!task) {
      std::println(stderr, "Error: Task not found: {}", opts.task_id);
      return 1;
    }
    print_task(*task);
    return 0;
  }

  auto tasks = db.load_tasks();
  if (!tasks) {
    std::println(stderr, "Error: {}", tasks.error().message());
    return 1;
  }

  StateCounts counts;
  for (const auto& task : *tasks) {
    ++counts.by_state[static_cast<std::size_t>(task.state)];
  }

  std::println("Database: {}", opts.db_file);
  std::println("Total:    {}", counts.total());
  for (auto state : {TaskState::Pending, TaskState::Running, TaskState::Succeeded,
                     TaskState::Failed, TaskState::Cancelled}) {
    std::println("  {:<10} {}", task_state_name(state), counts[state]);
  }
  return 0;
}

}  // namespace adminq::cli
