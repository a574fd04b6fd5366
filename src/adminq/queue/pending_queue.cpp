#include "adminq/queue/pending_queue.hpp"

#include <algorithm>

namespace adminq {

namespace {

constexpr std::string_view kRepositoryWildcard = ":*";

// "repo:*" -> "repo:", anything else -> empty.
auto wildcard_prefix(std::string_view key) -> std::string_view {
  if (key.size() > kRepositoryWildcard.size() &&
      key.ends_with(kRepositoryWildcard)) {
    return key.substr(0, key.size() - 1);
  }
  return {};
}

auto keys_conflict(std::string_view held, std::string_view key) -> bool {
  if (held == key) {
    return true;
  }
  if (auto prefix = wildcard_prefix(held);
      !prefix.empty() && key.starts_with(prefix)) {
    return true;
  }
  auto prefix = wildcard_prefix(key);
  return !prefix.empty() && held.starts_with(prefix);
}

}  // namespace

auto PendingQueue::push(TaskId id, std::string key, Clock::time_point ready_at)
    -> void {
  {
    std::lock_guard lock(mu_);
    index_.insert_or_assign(id, key);
    buckets_[key].push_back(
        Entry{.id = std::move(id), .ready_at = ready_at, .order = next_order_++});
  }
  cv_.notify_one();
}

auto PendingQueue::acquire() -> std::optional<Ticket> {
  std::unique_lock lock(mu_);

  while (true) {
    if (stopped_) {
      return std::nullopt;
    }

    auto now = Clock::now();
    std::optional<Clock::time_point> next_wake;
    decltype(buckets_)::iterator best = buckets_.end();

    if (!paused_) {
      for (auto it = buckets_.begin(); it != buckets_.end(); ++it) {
        if (it->second.empty() || blocked_locked(it->first)) {
          continue;
        }
        const auto& head = it->second.front();
        if (head.ready_at > now) {
          next_wake = next_wake ? std::min(*next_wake, head.ready_at)
                                : head.ready_at;
          continue;
        }
        if (best == buckets_.end() ||
            head.order < best->second.front().order) {
          best = it;
        }
      }
    }

    if (best != buckets_.end()) {
      Ticket ticket{.id = std::move(best->second.front().id),
                    .key = best->first};
      best->second.pop_front();
      locked_.insert(ticket.key);
      index_.erase(ticket.id);
      if (best->second.empty()) {
        buckets_.erase(best);
      }
      return ticket;
    }

    if (next_wake) {
      cv_.wait_until(lock, *next_wake);
    } else {
      cv_.wait(lock);
    }
  }
}

auto PendingQueue::release(std::string_view key) -> void {
  {
    std::lock_guard lock(mu_);
    if (auto it = locked_.find(key); it != locked_.end()) {
      locked_.erase(it);
    }
  }
  cv_.notify_all();
}

auto PendingQueue::remove(const TaskId& id) -> bool {
  std::lock_guard lock(mu_);
  auto idx = index_.find(id);
  if (idx == index_.end()) {
    return false;
  }

  auto bucket = buckets_.find(idx->second);
  if (bucket != buckets_.end()) {
    std::erase_if(bucket->second,
                  [&](const Entry& e) { return e.id == id; });
    if (bucket->second.empty()) {
      buckets_.erase(bucket);
    }
  }
  index_.erase(idx);
  return true;
}

auto PendingQueue::pause() -> void {
  std::lock_guard lock(mu_);
  paused_ = true;
}

auto PendingQueue::resume() -> void {
  {
    std::lock_guard lock(mu_);
    paused_ = false;
  }
  cv_.notify_all();
}

auto PendingQueue::stop() -> void {
  {
    std::lock_guard lock(mu_);
    stopped_ = true;
  }
  cv_.notify_all();
}

auto PendingQueue::paused() const -> bool {
  std::lock_guard lock(mu_);
  return paused_;
}

auto PendingQueue::stopped() const -> bool {
  std::lock_guard lock(mu_);
  return stopped_;
}

auto PendingQueue::is_locked(std::string_view key) const -> bool {
  std::lock_guard lock(mu_);
  return locked_.contains(key);
}

auto PendingQueue::is_blocked(std::string_view key) const -> bool {
  std::lock_guard lock(mu_);
  return blocked_locked(key);
}

auto PendingQueue::blocked_locked(std::string_view key) const -> bool {
  return std::ranges::any_of(locked_, [&](const std::string& held) {
    return keys_conflict(held, key);
  });
}

auto PendingQueue::contains(const TaskId& id) const -> bool {
  std::lock_guard lock(mu_);
  return index_.contains(id);
}

auto PendingQueue::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return index_.size();
}

auto PendingQueue::locked_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return locked_.size();
}

}  // namespace adminq
