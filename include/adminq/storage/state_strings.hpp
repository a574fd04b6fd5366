#pragma once

#include "adminq/queue/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace adminq {

namespace detail {

constexpr std::array<std::string_view, 5> kTaskStateNames = {
    "pending",
    "running",
    "succeeded",
    "failed",
    "cancelled",
};

constexpr std::array<std::string_view, 6> kTaskKindNames = {
    "docker_push",
    "docker_build",
    "docker_pull",
    "docker_tag",
    "ollama_pull",
    "ollama_run",
};

}  // namespace detail

[[nodiscard]] inline auto task_state_name(TaskState state) noexcept
    -> const char* {
  auto idx = std::to_underlying(state);
  return idx < detail::kTaskStateNames.size()
             ? detail::kTaskStateNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_state(std::string_view name) noexcept
    -> std::optional<TaskState> {
  auto it = std::ranges::find(detail::kTaskStateNames, name);
  if (it != detail::kTaskStateNames.end()) {
    return static_cast<TaskState>(
        std::ranges::distance(detail::kTaskStateNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto task_kind_name(TaskKind kind) noexcept
    -> const char* {
  auto idx = std::to_underlying(kind);
  return idx < detail::kTaskKindNames.size()
             ? detail::kTaskKindNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_kind(std::string_view name) noexcept
    -> std::optional<TaskKind> {
  auto it = std::ranges::find(detail::kTaskKindNames, name);
  if (it != detail::kTaskKindNames.end()) {
    return static_cast<TaskKind>(
        std::ranges::distance(detail::kTaskKindNames.begin(), it));
  }
  return std::nullopt;
}

}  // namespace adminq
