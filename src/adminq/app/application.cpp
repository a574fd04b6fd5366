#include "adminq/app/application.hpp"

#include "adminq/app/api/api_server.hpp"
#include "adminq/app/command_dispatcher.hpp"
#include "adminq/executor/composite_executor.hpp"
#include "adminq/queue/queue_manager.hpp"
#include "adminq/storage/persistence.hpp"
#include "adminq/storage/recovery.hpp"
#include "adminq/util/log.hpp"

namespace adminq {

Application::Application(Config config) : config_(std::move(config)) {
}

// Members are declared so that the queue and its workers go before the
// executor, store and database they reference.
Application::~Application() {
  stop();
}

auto Application::init() -> Result<void> {
  if (initialized_) {
    return ok();
  }

  if (!config_.storage.db_file.empty()) {
    persistence_ = std::make_unique<Persistence>(config_.storage.db_file);
    if (auto r = persistence_->open(); !r) {
      log::error("Failed to open database {}: {}", config_.storage.db_file,
                 r.error().message());
      persistence_.reset();
      return fail(r.error());
    }
    store_.set_persistence(persistence_.get());
  } else {
    log::info("No database configured, tasks are kept in memory only");
  }

  executor_ = create_composite_executor(config_.executors);
  queue_ = std::make_unique<QueueManager>(
      *executor_, store_, QueueOptions::from_config(config_.queue));
  dispatcher_ = std::make_unique<CommandDispatcher>(*queue_);

  if (persistence_) {
    if (auto r = recover(); !r) {
      return fail(r.error());
    }
  }

  initialized_ = true;
  return ok();
}

auto Application::recover() -> Result<void> {
  Recovery recovery(*persistence_, config_.queue.max_attempts);
  auto result = recovery.recover();
  if (!result) {
    return fail(result.error());
  }
  queue_->restore(std::move(result->tasks));
  queue_->evict_expired();
  return ok();
}

auto Application::start() -> Result<void> {
  if (!initialized_) {
    if (auto r = init(); !r) {
      return r;
    }
  }
  if (running_.exchange(true)) {
    return ok();
  }

  queue_->start();

  if (config_.api.enabled) {
    api_ = std::make_unique<ApiServer>(*dispatcher_, config_.api.port,
                                       config_.api.host);
    api_->start();
  }

  log::info("adminq started: concurrency {}, max attempts {}",
            config_.queue.concurrency, config_.queue.max_attempts);
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }

  log::info("Stopping adminq...");

  if (api_) {
    api_->stop();
  }
  queue_->stop();

  log::info("adminq stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::queue() -> QueueManager& {
  return *queue_;
}

auto Application::dispatcher() -> CommandDispatcher& {
  return *dispatcher_;
}

auto Application::persistence() -> Persistence* {
  return persistence_.get();
}

auto Application::api_server() -> ApiServer* {
  return api_.get();
}

}  // namespace adminq
