#pragma once

#include "adminq/config/config.hpp"
#include "adminq/core/error.hpp"
#include "adminq/queue/task_store.hpp"

#include <atomic>
#include <memory>

namespace adminq {

class ApiServer;
class CommandDispatcher;
class IExecutor;
class Persistence;
class QueueManager;

// Owns every long-lived component. init() opens storage and restores
// retained tasks, start() launches workers and the API, stop() tears down
// in reverse order.
class Application {
public:
  explicit Application(Config config);
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  [[nodiscard]] auto init() -> Result<void>;
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }
  [[nodiscard]] auto queue() -> QueueManager&;
  [[nodiscard]] auto dispatcher() -> CommandDispatcher&;
  [[nodiscard]] auto persistence() -> Persistence*;
  [[nodiscard]] auto api_server() -> ApiServer*;

private:
  auto recover() -> Result<void>;

  std::atomic<bool> running_{false};
  bool initialized_{false};
  Config config_;

  std::unique_ptr<Persistence> persistence_;
  TaskStore store_;
  std::unique_ptr<IExecutor> executor_;
  std::unique_ptr<QueueManager> queue_;
  std::unique_ptr<CommandDispatcher> dispatcher_;
  std::unique_ptr<ApiServer> api_;
};

}  // namespace adminq
