#include "adminq/executor/process_runner.hpp"

#include "adminq/core/constants.hpp"
#include "adminq/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace adminq {

namespace {

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Everything the child needs is built before fork(); the child only calls
// async-signal-safe functions.
struct ExecImage {
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;

  explicit ExecImage(const ProcessSpec& spec) {
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
      std::string_view entry{*e};
      auto eq = entry.find('=');
      auto name = entry.substr(0, eq);
      bool overridden = std::ranges::any_of(
          spec.env, [&](const auto& kv) { return kv.first == name; });
      if (!overridden) {
        env_storage.emplace_back(entry);
      }
    }
    for (const auto& [name, value] : spec.env) {
      env_storage.push_back(name + "=" + value);
    }

    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
      envp.push_back(entry.data());
    }
    envp.push_back(nullptr);
  }
};

auto fork_and_exec(ExecImage& image, const std::string& working_dir,
                   int output_write_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    setpgid(0, 0);

    dup2(output_write_fd, STDOUT_FILENO);
    dup2(output_write_fd, STDERR_FILENO);
    close(output_write_fd);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    if (!working_dir.empty()) {
      if (chdir(working_dir.c_str()) < 0) {
        _exit(127);
      }
    }

    execvpe(image.argv[0], image.argv.data(), image.envp.data());
    _exit(127);
  }

  close(output_write_fd);
  setpgid(pid, pid);
  return pid;
}

class LineSplitter {
public:
  explicit LineSplitter(const std::function<void(std::string_view)>& sink)
      : sink_(sink) {
  }

  auto feed(std::string_view chunk) -> void {
    for (char c : chunk) {
      // docker and ollama redraw progress with carriage returns
      if (c == '\n' || c == '\r') {
        flush();
      } else {
        partial_.push_back(c);
      }
    }
  }

  auto flush() -> void {
    if (!partial_.empty() && sink_) {
      sink_(partial_);
    }
    partial_.clear();
  }

private:
  const std::function<void(std::string_view)>& sink_;
  std::string partial_;
};

auto stop_requested(const ProcessHooks& hooks) -> bool {
  return hooks.should_stop && hooks.should_stop();
}

// Waits for the child, killing it if the deadline passes or a stop arrives
// after its output closed.
auto reap(pid_t pid, std::chrono::steady_clock::time_point deadline,
          const ProcessHooks& hooks, ProcessResult& result) -> void {
  int status = 0;
  while (true) {
    int rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      break;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
      result.exit_code = -1;
      return;
    }

    bool stop = stop_requested(hooks);
    bool expired = std::chrono::steady_clock::now() >= deadline;
    if (stop || expired) {
      result.cancelled = result.cancelled || stop;
      result.timed_out = result.timed_out || (!stop && expired);
      kill_process_group(pid);
      if (waitpid(pid, &status, 0) < 0) {
        result.exit_code = -1;
        return;
      }
      break;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }
  result.exit_code = get_exit_code(status);
}

}  // namespace

auto kill_process_group(pid_t pid) -> void {
  if (pid > 0) {
    kill(-pid, SIGKILL);
  }
}

auto format_command(const std::vector<std::string>& argv) -> std::string {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

auto run_process(const ProcessSpec& spec,
                 std::chrono::steady_clock::time_point deadline,
                 const ProcessHooks& hooks) -> ProcessResult {
  ProcessResult result;

  if (spec.argv.empty()) {
    result.error = "Empty command";
    return result;
  }

  int fds[2];
  if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
    result.error = std::string("Failed to create pipe: ") + strerror(errno);
    return result;
  }
  int read_fd = fds[0];

  ExecImage image{spec};
  pid_t pid = fork_and_exec(image, spec.working_dir, fds[1]);
  if (pid < 0) {
    close(read_fd);
    close(fds[1]);
    result.error = std::string("Failed to fork process: ") + strerror(errno);
    return result;
  }

  if (hooks.on_spawn) {
    hooks.on_spawn(pid);
  }

  LineSplitter lines{hooks.on_line};
  std::array<char, io::kReadBufferSize> buffer;
  result.output.reserve(io::kInitialOutputReserve);

  while (true) {
    if (stop_requested(hooks)) {
      result.cancelled = true;
      kill_process_group(pid);
      break;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      kill_process_group(pid);
      break;
    }

    auto wait = std::min(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timing::kCancelPollInterval));
    pollfd pfd{.fd = read_fd, .events = POLLIN, .revents = 0};
    int rc = poll(&pfd, 1, static_cast<int>(wait.count()) + 1);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (rc == 0) {
      continue;
    }

    ssize_t bytes_read = read(read_fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      break;
    }
    if (bytes_read == 0) {
      break;
    }

    std::string_view chunk{buffer.data(), static_cast<std::size_t>(bytes_read)};
    lines.feed(chunk);
    if (result.output.size() < io::kMaxOutputSize) {
      result.output.append(
          chunk.substr(0, io::kMaxOutputSize - result.output.size()));
    }
  }
  lines.flush();
  close(read_fd);

  reap(pid, deadline, hooks, result);
  return result;
}

}  // namespace adminq
