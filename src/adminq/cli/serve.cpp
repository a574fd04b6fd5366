#include "adminq/app/application.hpp"
#include "adminq/cli/commands.hpp"
#include "adminq/config/config.hpp"
#include "adminq/util/daemon.hpp"
#include "adminq/util/log.hpp"

#include <print>

namespace adminq::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  Config config;
  if (!opts.config_file.empty()) {
    auto result = ConfigLoader::load_from_file(opts.config_file);
    if (!result) {
      std::println(stderr, "Error: {}", result.error().message());
      return 1;
    }
    config = std::move(*result);
  }

  if (opts.no_api) config.api.enabled = false;
  if (opts.db_file) config.storage.db_file = *opts.db_file;
  if (opts.port) config.api.port = *opts.port;
  if (opts.dry_run) config.executors.dry_run = true;

  const auto log_file = opts.log_file.value_or(config.logging.file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires a log file (set logging.file or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  const auto& pid_file = config.logging.pid_file;
  if (!pid_file.empty() && !write_pid_file(pid_file)) {
    std::println(stderr, "Error: Failed to write pid file: {}", pid_file);
    return 1;
  }

  log::set_level(config.logging.level);
  log::start();

  Application app(std::move(config));

  if (auto r = app.init(); !r) {
    log::error("Initialization failed: {}", r.error().message());
    log::stop();
    remove_pid_file(pid_file);
    return 1;
  }

  setup_signal_handlers();

  const auto& cfg = app.config();
  if (cfg.api.enabled) {
    log::info("adminq starting on {}:{}...", cfg.api.host, cfg.api.port);
  } else {
    log::info("adminq starting (queue only, no API)...");
  }

  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    remove_pid_file(pid_file);
    return 1;
  }

  wait_for_shutdown();
  log::info("Received shutdown signal, stopping...");
  app.stop();

  remove_pid_file(pid_file);
  log::stop();
  return 0;
}

}  // namespace adminq::cli
