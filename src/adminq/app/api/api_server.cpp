#include "adminq/app/api/api_server.hpp"

#include "adminq/app/command_dispatcher.hpp"
#include "adminq/util/log.hpp"
#include "adminq/util/time.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>

#include <crow.h>

namespace adminq {

using json = nlohmann::json;

namespace {

auto json_response(const json& j, int status = 200) -> crow::response {
  crow::response resp(status, j.dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

auto http_status(const CommandError& err) -> int {
  if (err.code == error_code::kTaskNotFound) {
    return 404;
  }
  if (err.code == error_code::kValidation ||
      err.code == error_code::kUnknownCommand) {
    return 400;
  }
  return 503;
}

auto reply(const CommandResult& result) -> crow::response {
  return json_response(to_reply(result),
                       result ? 200 : http_status(result.error()));
}

auto error_response(std::string_view code, std::string_view message)
    -> crow::response {
  return reply(std::unexpected(
      CommandError{std::string(code), std::string(message)}));
}

}  // namespace

struct ApiServer::Impl {
  CommandDispatcher& dispatcher;
  uint16_t port;
  std::string host;

  std::unique_ptr<crow::SimpleApp> crow_app;
  std::thread server_thread;
  std::atomic<bool> running{false};

  Impl(CommandDispatcher& d, uint16_t p, const std::string& h)
      : dispatcher(d), port(p), host(h) {
  }

  auto setup_routes() -> void;
};

ApiServer::ApiServer(CommandDispatcher& dispatcher, uint16_t port,
                     const std::string& host)
    : impl_(std::make_unique<Impl>(dispatcher, port, host)) {
}

ApiServer::~ApiServer() {
  stop();
}

auto ApiServer::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }

  impl_->crow_app = std::make_unique<crow::SimpleApp>();
  impl_->crow_app->loglevel(crow::LogLevel::Warning);
  impl_->setup_routes();

  impl_->crow_app->signal_clear();

  impl_->server_thread = std::thread([this]() {
    log::info("API server starting on {}:{}", impl_->host, impl_->port);
    impl_->crow_app->bindaddr(impl_->host)
        .port(impl_->port)
        .multithreaded()
        .run();
  });
}

auto ApiServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping API server...");

  if (impl_->crow_app) {
    impl_->crow_app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->crow_app.reset();
  log::info("API server stopped");
}

auto ApiServer::is_running() const noexcept -> bool {
  return impl_->running.load();
}

auto ApiServer::Impl::setup_routes() -> void {
  CROW_ROUTE((*crow_app), "/api/health")
  ([]() {
    json j = {{"status", "healthy"}, {"timestamp", format_timestamp()}};
    return json_response(j);
  });

  CROW_ROUTE((*crow_app), "/cmd")
      .methods(crow::HTTPMethod::POST)([this](const crow::request& req) {
        try {
          auto body = json::parse(req.body);
          auto command = body.value("command", std::string{});
          if (command.empty()) {
            return error_response(error_code::kValidation,
                                  "command is required");
          }
          return reply(dispatcher.dispatch(
              command, body.value("params", json::object())));
        } catch (const json::exception& e) {
          return error_response(error_code::kValidation, e.what());
        }
      });

  CROW_ROUTE((*crow_app), "/api/tasks")
  ([this](const crow::request& req) {
    json params = json::object();
    if (auto* state = req.url_params.get("state")) {
      params["state"] = state;
    }
    if (auto* key = req.url_params.get("key")) {
      params["key"] = key;
    }
    if (auto* limit = req.url_params.get("limit")) {
      try {
        params["limit"] = std::stoll(limit);
      } catch (const std::exception&) {
        return error_response(error_code::kValidation,
                              "limit must be a number");
      }
    }
    if (auto* logs = req.url_params.get("include_logs")) {
      params["include_logs"] = std::string_view(logs) == "true";
    }
    return reply(dispatcher.dispatch("queue_status", params));
  });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>")
  ([this](const crow::request& req, const std::string& task_id) {
    json params = {{"task_id", task_id}};
    if (auto* logs = req.url_params.get("include_logs")) {
      params["include_logs"] = std::string_view(logs) == "true";
    }
    return reply(dispatcher.dispatch("queue_task_status", params));
  });

  CROW_ROUTE((*crow_app), "/api/tasks/<string>/cancel")
      .methods(crow::HTTPMethod::POST)([this](const std::string& task_id) {
        return reply(
            dispatcher.dispatch("queue_cancel", json{{"task_id", task_id}}));
      });
}

}  // namespace adminq
