#pragma once

#include <atomic>
#include <string>

namespace adminq {

extern std::atomic<bool> g_shutdown_requested;

[[nodiscard]] auto daemonize() -> bool;
void setup_signal_handlers();
void wait_for_shutdown();

// The file holds the current pid followed by a newline.
[[nodiscard]] auto write_pid_file(const std::string& path) -> bool;
void remove_pid_file(const std::string& path);

}  // namespace adminq
