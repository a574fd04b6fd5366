#pragma once

#include "adminq/core/error.hpp"
#include "adminq/util/id.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace adminq {

// Scheduling core: per-key FIFO buckets plus the key-lock table.
// A bucket head is eligible when its key is unlocked, its ready_at has
// passed and the queue is not paused. acquire() hands out the eligible head
// that was pushed earliest and locks its key until release().
// A key of the form "repo:*" covers the whole repository: it is blocked
// while any "repo:<tag>" key is locked, and blocks them while it is held.
class PendingQueue {
public:
  using Clock = std::chrono::steady_clock;

  struct Ticket {
    TaskId id;
    std::string key;
  };

  PendingQueue() = default;

  PendingQueue(const PendingQueue&) = delete;
  PendingQueue& operator=(const PendingQueue&) = delete;

  auto push(TaskId id, std::string key, Clock::time_point ready_at = {})
      -> void;

  // Blocks until a head is eligible; nullopt once stop() was called.
  [[nodiscard]] auto acquire() -> std::optional<Ticket>;

  auto release(std::string_view key) -> void;

  // Drops a queued entry; false if it was not queued (already taken).
  auto remove(const TaskId& id) -> bool;

  auto pause() -> void;
  auto resume() -> void;
  auto stop() -> void;

  [[nodiscard]] auto paused() const -> bool;
  [[nodiscard]] auto stopped() const -> bool;
  [[nodiscard]] auto is_locked(std::string_view key) const -> bool;
  [[nodiscard]] auto contains(const TaskId& id) const -> bool;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto locked_count() const -> std::size_t;

  // Exact key or a repository-wide key that covers it is held.
  [[nodiscard]] auto is_blocked(std::string_view key) const -> bool;

private:
  auto blocked_locked(std::string_view key) const -> bool;

  struct Entry {
    TaskId id;
    Clock::time_point ready_at;
    std::uint64_t order;
  };

  using Bucket = std::deque<Entry>;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Bucket, StringHash, StringEqual> buckets_;
  std::unordered_set<std::string, StringHash, StringEqual> locked_;
  std::unordered_map<TaskId, std::string> index_;
  std::uint64_t next_order_{0};
  bool paused_{false};
  bool stopped_{false};
};

}  // namespace adminq
