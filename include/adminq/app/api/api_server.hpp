#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace adminq {

class CommandDispatcher;

// HTTP front end over the command dispatcher: POST /cmd plus a small REST
// view of tasks.
class ApiServer {
public:
  ApiServer(CommandDispatcher& dispatcher, uint16_t port = 8060,
            const std::string& host = "127.0.0.1");
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  auto operator=(const ApiServer&) -> ApiServer& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace adminq
