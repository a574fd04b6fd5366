#include "adminq/cli/commands.hpp"
#include "adminq/storage/persistence.hpp"
#include "adminq/storage/state_strings.hpp"

#include <chrono>
#include <format>
#include <print>

namespace adminq::cli {

auto cmd_list(const ListOptions& opts) -> int {
  std::optional<TaskState> state;
  if (!opts.state.empty()) {
    state = parse_task_state(opts.state);
    if (!state) {
      std::println(stderr, "Error: Unknown state: {}", opts.state);
      return 1;
    }
  }

  Persistence db(opts.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}", r.error().message());
    return 1;
  }

  auto result = db.load_tasks();
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }

  std::size_t shown = 0;
  for (const auto& task : *result) {
    if (state && task.state != *state) continue;
    if (!opts.key.empty() && task.key != opts.key) continue;
    if (shown == 0) {
      std::println("{:<36} {:<13} {:<10} {:>3} {:<32} {:<20}", "TASK_ID", "KIND",
                   "STATE", "TRY", "KEY", "CREATED");
    }
    std::println("{:<36} {:<13} {:<10} {:>3} {:<32} {:%Y-%m-%d %H:%M:%S}",
                 task.id.str(), task_kind_name(task.kind),
                 task_state_name(task.state), task.attempt_count,
                 task.key.substr(0, 32),
                 std::chrono::floor<std::chrono::seconds>(task.created_at));
    if (++shown >= opts.limit) break;
  }

  if (shown == 0) {
    std::println("No tasks found.");
  }
  return 0;
}

}  // namespace adminq::cli
