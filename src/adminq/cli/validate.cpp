#include "adminq/cli/commands.hpp"
#include "adminq/config/config.hpp"

#include <print>

namespace adminq::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "✗ {} - {}", opts.config_file,
                 result.error().message());
    return 1;
  }

  const auto& config = *result;
  std::println("✓ {} - Valid", opts.config_file);
  std::println("  concurrency {}, max attempts {}, attempt timeout {}s",
               config.queue.concurrency, config.queue.max_attempts,
               config.queue.attempt_timeout_sec);
  std::println("  storage: {}", config.storage.db_file.empty()
                                    ? "in-memory"
                                    : config.storage.db_file);
  if (config.executors.dry_run) {
    std::println("  executors: dry run");
  }
  std::println("\nEffective configuration:\n{}", ConfigLoader::dump(config));
  return 0;
}

}  // namespace adminq::cli
