#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace adminq {

struct ProcessSpec {
  std::vector<std::string> argv;
  // Added on top of the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;
  std::string working_dir;
};

struct ProcessResult {
  int exit_code{-1};
  std::string output;  // stdout and stderr interleaved
  bool timed_out{false};
  bool cancelled{false};
  std::string error;   // set when the process could not be started

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return error.empty() && !timed_out && !cancelled && exit_code == 0;
  }
};

struct ProcessHooks {
  std::function<bool()> should_stop;
  std::function<void(std::string_view)> on_line;
  std::function<void(pid_t)> on_spawn;
};

// Runs argv in its own process group and blocks until it exits, the
// deadline passes or should_stop() turns true. The group is SIGKILLed on
// timeout and on stop.
[[nodiscard]] auto run_process(const ProcessSpec& spec,
                               std::chrono::steady_clock::time_point deadline,
                               const ProcessHooks& hooks) -> ProcessResult;

auto kill_process_group(pid_t pid) -> void;

[[nodiscard]] auto format_command(const std::vector<std::string>& argv)
    -> std::string;

}  // namespace adminq
