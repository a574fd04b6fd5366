#pragma once

#include "adminq/core/constants.hpp"
#include "adminq/core/error.hpp"
#include "adminq/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace adminq {

enum class TaskState : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  Cancelled,
};

enum class TaskKind : std::uint8_t {
  DockerPush,
  DockerBuild,
  DockerPull,
  DockerTag,
  OllamaPull,
  OllamaRun,
};

[[nodiscard]] constexpr auto is_terminal(TaskState state) noexcept -> bool {
  return state == TaskState::Succeeded || state == TaskState::Failed ||
         state == TaskState::Cancelled;
}

// Running -> Pending is the retry edge; nothing leaves a terminal state.
[[nodiscard]] constexpr auto can_transition(TaskState from, TaskState to) noexcept
    -> bool {
  switch (from) {
    case TaskState::Pending:
      return to == TaskState::Running || to == TaskState::Cancelled;
    case TaskState::Running:
      return to == TaskState::Succeeded || to == TaskState::Failed ||
             to == TaskState::Cancelled || to == TaskState::Pending;
    case TaskState::Succeeded:
    case TaskState::Failed:
    case TaskState::Cancelled:
      return false;
  }
  return false;
}

struct TaskLogEntry {
  std::chrono::system_clock::time_point at{};
  std::string message;
};

struct Task {
  TaskId id;
  TaskKind kind{TaskKind::DockerPush};
  std::string key;
  nlohmann::json params = nlohmann::json::object();

  TaskState state{TaskState::Pending};
  int attempt_count{0};
  std::uint64_t sequence{0};

  std::chrono::system_clock::time_point created_at{};
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> finished_at;

  std::optional<nlohmann::json> result;
  bool cancel_requested{false};

  int progress{0};
  std::string current_step;
  std::vector<TaskLogEntry> logs;

  // Bumped on every committed mutation; orders write-through.
  std::uint64_t revision{0};

  // Moves along an allowed edge of the state machine.
  [[nodiscard]] auto transition_to(TaskState next) -> Result<void> {
    if (!can_transition(state, next)) {
      return fail(Error::InvalidTransition);
    }
    state = next;
    return ok();
  }

  // Keeps the newest kMaxTaskLogLines lines, each cut to kMaxLogLineLength.
  auto add_log(std::string message,
               std::chrono::system_clock::time_point at =
                   std::chrono::system_clock::now()) -> void {
    if (message.size() > limits::kMaxLogLineLength) {
      message.resize(limits::kMaxLogLineLength);
    }
    logs.push_back(TaskLogEntry{.at = at, .message = std::move(message)});
    if (logs.size() > limits::kMaxTaskLogLines) {
      logs.erase(logs.begin(),
                 logs.begin() + static_cast<std::ptrdiff_t>(
                                    logs.size() - limits::kMaxTaskLogLines));
    }
  }

  [[nodiscard]] auto duration() const -> std::optional<std::chrono::milliseconds> {
    if (!started_at) {
      return std::nullopt;
    }
    auto end = finished_at.value_or(std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at);
  }
};

// Failure recorded when a shutdown cut short the last allowed attempt.
[[nodiscard]] inline auto interrupted_failure(int attempts) -> nlohmann::json {
  return nlohmann::json{{"error", "attempt interrupted by shutdown"},
                        {"retryable", true},
                        {"attempts", attempts}};
}

// Point-in-time copy handed to callers.
using TaskSnapshot = Task;

}  // namespace adminq
