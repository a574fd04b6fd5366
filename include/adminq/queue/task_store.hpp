#pragma once

#include "adminq/core/error.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/util/id.hpp"

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace adminq {

class Persistence;

struct TaskFilter {
  std::optional<TaskState> state;
  std::optional<std::string> key;
  std::optional<std::size_t> limit;
};

struct StateCounts {
  std::array<std::size_t, 5> by_state{};

  [[nodiscard]] auto operator[](TaskState s) const -> std::size_t {
    return by_state[static_cast<std::size_t>(s)];
  }
  [[nodiscard]] auto total() const -> std::size_t {
    std::size_t n = 0;
    for (auto c : by_state) {
      n += c;
    }
    return n;
  }
};

enum class WriteMode : std::uint8_t {
  Through,
  // Committed in memory only; reaches disk with the next Through write.
  Deferred,
};

template <typename F>
concept TaskMutation = std::invocable<F&, Task&> &&
                       std::same_as<std::invoke_result_t<F&, Task&>, Result<void>>;

// Authoritative table of task snapshots. Every mutation runs under one
// mutex on a copy and is committed only if the mutation succeeds, so readers
// never observe a half-applied change.
class TaskStore {
public:
  explicit TaskStore(Persistence* persistence = nullptr)
      : persistence_(persistence) {}

  TaskStore(const TaskStore&) = delete;
  TaskStore& operator=(const TaskStore&) = delete;

  auto set_persistence(Persistence* persistence) -> void {
    persistence_ = persistence;
  }

  [[nodiscard]] auto insert(Task task) -> Result<void>;
  [[nodiscard]] auto get(const TaskId& id) const -> Result<TaskSnapshot>;
  [[nodiscard]] auto list(const TaskFilter& filter) const
      -> std::vector<TaskSnapshot>;

  template <TaskMutation F>
  auto update(const TaskId& id, F&& mutate,
              WriteMode mode = WriteMode::Through) -> Result<TaskSnapshot> {
    TaskSnapshot committed;
    {
      std::lock_guard lock(mu_);
      auto it = tasks_.find(id);
      if (it == tasks_.end()) {
        return fail(Error::NotFound);
      }
      Task draft = it->second;
      if (auto r = mutate(draft); !r) {
        return fail(r.error());
      }
      draft.revision = it->second.revision + 1;
      it->second = std::move(draft);
      committed = it->second;
    }
    if (mode == WriteMode::Through) {
      write_through(committed);
    }
    return committed;
  }

  auto append_log(const TaskId& id, std::string message) -> void;

  [[nodiscard]] auto cancel_requested(const TaskId& id) const -> bool;
  [[nodiscard]] auto contains(const TaskId& id) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto counts() const -> StateCounts;

  // Drops terminal tasks finished before now - retention, then the oldest
  // terminal tasks while more than max_retained remain.
  auto evict_expired(std::chrono::seconds retention, std::size_t max_retained,
                     std::chrono::system_clock::time_point now =
                         std::chrono::system_clock::now()) -> std::size_t;

  auto clear_completed() -> std::size_t;

  // Bulk insert of recovered tasks; no write-through.
  auto load(std::vector<Task> tasks) -> void;

  [[nodiscard]] auto max_sequence() const -> std::uint64_t;

private:
  auto index_key(const Task& task) -> void;
  auto erase_locked(const TaskId& id) -> void;
  auto write_through(const TaskSnapshot& task) -> void;
  auto delete_through(const std::vector<TaskId>& ids) -> void;

  mutable std::mutex mu_;
  std::unordered_map<TaskId, Task> tasks_;
  std::unordered_map<std::string, std::vector<TaskId>, StringHash, StringEqual>
      by_key_;

  // Serialises disk writes; never taken while holding mu_.
  std::mutex persist_mu_;
  std::unordered_map<TaskId, std::uint64_t> persisted_revision_;
  Persistence* persistence_{nullptr};
};

}  // namespace adminq
