#include "adminq/queue/task_store.hpp"

#include "adminq/storage/persistence.hpp"
#include "adminq/util/log.hpp"

#include <algorithm>
#include <ranges>

namespace adminq {

auto TaskStore::index_key(const Task& task) -> void {
  by_key_[task.key].push_back(task.id);
}

auto TaskStore::erase_locked(const TaskId& id) -> void {
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return;
  }
  if (auto k = by_key_.find(it->second.key); k != by_key_.end()) {
    std::erase(k->second, id);
    if (k->second.empty()) {
      by_key_.erase(k);
    }
  }
  tasks_.erase(it);
}

auto TaskStore::insert(Task task) -> Result<void> {
  TaskSnapshot committed;
  {
    std::lock_guard lock(mu_);
    if (tasks_.contains(task.id)) {
      return fail(Error::InvalidArgument);
    }
    task.revision = 1;
    index_key(task);
    committed = task;
    tasks_.emplace(task.id, std::move(task));
  }
  write_through(committed);
  return ok();
}

auto TaskStore::get(const TaskId& id) const -> Result<TaskSnapshot> {
  std::lock_guard lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return fail(Error::NotFound);
  }
  return it->second;
}

auto TaskStore::list(const TaskFilter& filter) const
    -> std::vector<TaskSnapshot> {
  std::vector<TaskSnapshot> out;
  {
    std::lock_guard lock(mu_);
    auto matches = [&](const Task& t) {
      return !filter.state || t.state == *filter.state;
    };

    if (filter.key) {
      if (auto k = by_key_.find(*filter.key); k != by_key_.end()) {
        for (const auto& id : k->second) {
          if (auto it = tasks_.find(id); it != tasks_.end() && matches(it->second)) {
            out.push_back(it->second);
          }
        }
      }
    } else {
      for (const auto& [_, task] : tasks_) {
        if (matches(task)) {
          out.push_back(task);
        }
      }
    }
  }

  std::ranges::sort(out, [](const Task& a, const Task& b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.sequence < b.sequence;
  });

  if (filter.limit && out.size() > *filter.limit) {
    out.resize(*filter.limit);
  }
  return out;
}

auto TaskStore::append_log(const TaskId& id, std::string message) -> void {
  std::lock_guard lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return;
  }
  it->second.add_log(std::move(message));
  ++it->second.revision;
}

auto TaskStore::cancel_requested(const TaskId& id) const -> bool {
  std::lock_guard lock(mu_);
  auto it = tasks_.find(id);
  return it != tasks_.end() && it->second.cancel_requested;
}

auto TaskStore::contains(const TaskId& id) const -> bool {
  std::lock_guard lock(mu_);
  return tasks_.contains(id);
}

auto TaskStore::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return tasks_.size();
}

auto TaskStore::counts() const -> StateCounts {
  StateCounts c;
  std::lock_guard lock(mu_);
  for (const auto& [_, task] : tasks_) {
    ++c.by_state[static_cast<std::size_t>(task.state)];
  }
  return c;
}

auto TaskStore::evict_expired(std::chrono::seconds retention,
                              std::size_t max_retained,
                              std::chrono::system_clock::time_point now)
    -> std::size_t {
  std::vector<TaskId> evicted;
  {
    std::lock_guard lock(mu_);
    auto cutoff = now - retention;

    std::vector<std::pair<std::chrono::system_clock::time_point, TaskId>>
        finished;
    for (const auto& [id, task] : tasks_) {
      if (!is_terminal(task.state)) {
        continue;
      }
      auto at = task.finished_at.value_or(task.created_at);
      if (at < cutoff) {
        evicted.push_back(id);
      } else {
        finished.emplace_back(at, id);
      }
    }
    for (const auto& id : evicted) {
      erase_locked(id);
    }

    if (tasks_.size() > max_retained) {
      std::ranges::sort(finished, {}, &decltype(finished)::value_type::first);
      for (auto& [_, id] : finished) {
        if (tasks_.size() <= max_retained) {
          break;
        }
        erase_locked(id);
        evicted.push_back(std::move(id));
      }
    }
  }

  if (!evicted.empty()) {
    log::debug("Evicted {} finished tasks", evicted.size());
    delete_through(evicted);
  }
  return evicted.size();
}

auto TaskStore::clear_completed() -> std::size_t {
  std::vector<TaskId> cleared;
  {
    std::lock_guard lock(mu_);
    for (const auto& [id, task] : tasks_) {
      if (is_terminal(task.state)) {
        cleared.push_back(id);
      }
    }
    for (const auto& id : cleared) {
      erase_locked(id);
    }
  }
  if (!cleared.empty()) {
    delete_through(cleared);
  }
  return cleared.size();
}

auto TaskStore::load(std::vector<Task> tasks) -> void {
  std::lock_guard plock(persist_mu_);
  std::lock_guard lock(mu_);
  for (auto& task : tasks) {
    if (tasks_.contains(task.id)) {
      continue;
    }
    persisted_revision_[task.id] = task.revision;
    index_key(task);
    tasks_.emplace(task.id, std::move(task));
  }
}

auto TaskStore::max_sequence() const -> std::uint64_t {
  std::lock_guard lock(mu_);
  std::uint64_t max_seq = 0;
  for (const auto& [_, task] : tasks_) {
    max_seq = std::max(max_seq, task.sequence);
  }
  return max_seq;
}

auto TaskStore::write_through(const TaskSnapshot& task) -> void {
  if (persistence_ == nullptr) {
    return;
  }

  std::lock_guard plock(persist_mu_);
  // A concurrent writer may already have stored a newer revision, and an
  // evicted task must not be written back.
  if (auto it = persisted_revision_.find(task.id);
      it != persisted_revision_.end() && it->second >= task.revision) {
    return;
  }
  if (!contains(task.id)) {
    return;
  }

  if (auto r = persistence_->save_task(task); !r) {
    log::warn("Failed to persist task {}: {}", task.id, r.error().message());
    return;
  }
  persisted_revision_[task.id] = task.revision;
}

auto TaskStore::delete_through(const std::vector<TaskId>& ids) -> void {
  if (persistence_ == nullptr) {
    return;
  }

  std::lock_guard plock(persist_mu_);
  for (const auto& id : ids) {
    persisted_revision_.erase(id);
  }
  if (auto r = persistence_->delete_tasks(ids); !r) {
    log::warn("Failed to delete {} tasks from storage: {}", ids.size(),
              r.error().message());
  }
}

}  // namespace adminq
