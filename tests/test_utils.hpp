#pragma once

#include "adminq/executor/executor.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/util/id.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <optional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <unistd.h>

namespace adminq::test {

using namespace std::chrono_literals;

[[nodiscard]] inline auto task_id(std::string s) -> TaskId {
  return TaskId{std::move(s)};
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

// Polls pred until it holds or the timeout passes.
template <typename Pred>
[[nodiscard]] auto wait_until(Pred pred,
                              std::chrono::milliseconds timeout = 5000ms)
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

[[nodiscard]] inline auto make_task(std::string id, std::string key,
                                    TaskState state = TaskState::Pending,
                                    std::uint64_t sequence = 0) -> Task {
  Task t;
  t.id = TaskId{std::move(id)};
  t.kind = TaskKind::DockerPush;
  t.key = std::move(key);
  t.params = {{"image_name", "repo"}, {"tag", "latest"}};
  t.state = state;
  t.sequence = sequence;
  t.created_at = std::chrono::system_clock::now();
  return t;
}

[[nodiscard]] inline auto make_request(TaskKind kind, nlohmann::json params,
                                       std::chrono::milliseconds timeout = 10000ms)
    -> ExecutorRequest {
  ExecutorRequest req;
  req.attempt_id = AttemptId{"attempt-1"};
  req.kind = kind;
  req.params = std::move(params);
  req.deadline = std::chrono::steady_clock::now() + timeout;
  return req;
}

// Starts one attempt and blocks for its outcome; nullopt if none arrived in
// time. Log lines are collected into `logs` when given.
inline auto run_attempt(IExecutor& executor, ExecutorRequest req,
                        std::vector<std::string>* logs = nullptr,
                        std::chrono::milliseconds wait = 15000ms)
    -> std::optional<ExecutionOutcome> {
  auto promise = std::make_shared<std::promise<ExecutionOutcome>>();
  auto future = promise->get_future();
  auto log_mu = std::make_shared<std::mutex>();

  ExecutionSink sink;
  if (logs != nullptr) {
    sink.on_log = [logs, log_mu](const AttemptId&, std::string_view line) {
      std::lock_guard lock(*log_mu);
      logs->emplace_back(line);
    };
  }
  sink.on_complete = [promise](const AttemptId&, ExecutionOutcome outcome) {
    promise->set_value(std::move(outcome));
  };
  executor.start(std::move(req), std::move(sink));

  if (future.wait_for(wait) != std::future_status::ready) {
    return std::nullopt;
  }
  return future.get();
}

// Temp file path removed on destruction.
class TempPath {
public:
  explicit TempPath(std::string_view suffix = ".db") {
    std::string pattern = "/tmp/adminq_test_XXXXXX";
    int fd = ::mkstemp(pattern.data());
    if (fd >= 0) {
      ::close(fd);
      std::filesystem::remove(pattern);
    }
    path_ = pattern + std::string(suffix);
  }
  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_ + "-wal", ec);
    std::filesystem::remove(path_ + "-shm", ec);
  }

  TempPath(const TempPath&) = delete;
  auto operator=(const TempPath&) -> TempPath& = delete;

  [[nodiscard]] auto str() const -> const std::string& { return path_; }

private:
  std::string path_;
};

// One-shot latch that an attempt can wait on; also wakes on cancellation.
class Gate {
public:
  void open() {
    {
      std::lock_guard lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

  // False when the token was cancelled before the gate opened.
  [[nodiscard]] auto wait(const CancellationToken& token,
                          std::chrono::milliseconds timeout = 10000ms) -> bool {
    std::unique_lock lock(mu_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!open_) {
      if (token.is_cancelled() || std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      cv_.wait_for(lock, 2ms);
    }
    return true;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

// Executor double. Every attempt runs the installed handler on its own
// thread and records which keys were running at the same time.
class ScriptedExecutor : public IExecutor {
public:
  using Handler =
      std::function<ExecutionOutcome(const ExecutorRequest&, int call)>;

  struct Start {
    AttemptId attempt_id;
    std::string key;
    nlohmann::json params;
  };

  ScriptedExecutor() = default;
  ~ScriptedExecutor() override { join(); }

  void set_handler(Handler handler) {
    std::lock_guard lock(mu_);
    handler_ = std::move(handler);
  }

  // Outcomes handed out in order; the last one repeats.
  void script(std::vector<ExecutionOutcome> outcomes) {
    set_handler([outcomes = std::move(outcomes)](const ExecutorRequest&,
                                                 int call) {
      auto idx = std::min<std::size_t>(static_cast<std::size_t>(call),
                                       outcomes.size() - 1);
      return outcomes[idx];
    });
  }

  [[nodiscard]] auto supports(TaskKind) const -> bool override { return true; }

  [[nodiscard]] auto validate(TaskKind, const nlohmann::json& params) const
      -> Validation override {
    if (!params.is_object()) {
      return std::unexpected(std::string("params must be an object"));
    }
    if (params.value("invalid", false)) {
      return std::unexpected(std::string("rejected by test executor"));
    }
    return {};
  }

  [[nodiscard]] auto derive_key(TaskKind, const nlohmann::json& params) const
      -> std::string override {
    return params.value("image_name", std::string{"default"}) + ":" +
           params.value("tag", std::string{"latest"});
  }

  auto start(ExecutorRequest req, ExecutionSink sink) -> void override {
    std::lock_guard lock(mu_);
    int call = calls_++;
    starts_.push_back(Start{req.attempt_id, req.key, req.params});
    threads_.emplace_back([this, req = std::move(req), sink = std::move(sink),
                           call, handler = handler_]() mutable {
      enter(req.key);
      if (sink.on_progress) {
        sink.on_progress(req.attempt_id, 50, "working");
      }
      if (sink.on_log) {
        sink.on_log(req.attempt_id, "scripted attempt running");
      }
      auto outcome = handler ? handler(req, call) : ExecutionOutcome::success();
      leave(req.key);
      sink.on_complete(req.attempt_id, std::move(outcome));
    });
  }

  auto cancel(const AttemptId& attempt_id) -> void override {
    std::lock_guard lock(mu_);
    cancels_.push_back(attempt_id);
  }

  [[nodiscard]] auto start_count() const -> int {
    std::lock_guard lock(mu_);
    return calls_;
  }

  [[nodiscard]] auto starts() const -> std::vector<Start> {
    std::lock_guard lock(mu_);
    return starts_;
  }

  [[nodiscard]] auto cancel_count() const -> std::size_t {
    std::lock_guard lock(mu_);
    return cancels_.size();
  }

  [[nodiscard]] auto max_per_key() const -> int {
    std::lock_guard lock(mu_);
    return max_per_key_;
  }

  [[nodiscard]] auto max_overall() const -> int {
    std::lock_guard lock(mu_);
    return max_overall_;
  }

  [[nodiscard]] auto running() const -> int {
    std::lock_guard lock(mu_);
    return overall_;
  }

  void join() {
    std::vector<std::thread> threads;
    {
      std::lock_guard lock(mu_);
      threads.swap(threads_);
    }
    for (auto& t : threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

private:
  void enter(const std::string& key) {
    std::lock_guard lock(mu_);
    max_per_key_ = std::max(max_per_key_, ++per_key_[key]);
    max_overall_ = std::max(max_overall_, ++overall_);
  }

  void leave(const std::string& key) {
    std::lock_guard lock(mu_);
    --per_key_[key];
    --overall_;
  }

  mutable std::mutex mu_;
  Handler handler_;
  int calls_{0};
  std::vector<Start> starts_;
  std::vector<AttemptId> cancels_;
  std::vector<std::thread> threads_;
  std::unordered_map<std::string, int> per_key_;
  int max_per_key_{0};
  int overall_{0};
  int max_overall_{0};
};

}  // namespace adminq::test
