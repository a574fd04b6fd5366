#include "adminq/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("adminq - task queue for long-running admin operations");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve                 Run the queue workers and the API server");
  std::println("  status [task_id]      Show queue totals, or one task in detail");
  std::println("  list                  List retained tasks");
  std::println("  validate <file>       Check a config file and print it");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (default: adminq.db)");
  std::println("  --port <port>         API server port (serve)");
  std::println("  --log-file <file>     Write logs to a file (serve)");
  std::println("  --no-api              Do not start the API server (serve)");
  std::println("  --dry-run             Complete tasks without running them (serve)");
  std::println("  -d, --daemon          Run as daemon (serve)");
  std::println("  --state <state>       Filter by state (list)");
  std::println("  --key <key>           Filter by contention key (list)");
  std::println("  --limit <n>           Maximum rows (list, default: 50)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c adminq.yaml", prog);
  std::println("  {} list --state running", prog);
  std::println("  {} status 3f1c...", prog);
}

void print_version() {
  std::println("adminq v0.1.0");
}

struct Options {
  std::string command;
  std::string positional;
  std::string config_file;
  std::string db_file;
  std::string log_file;
  std::string state;
  std::string key;
  std::string port;
  std::string limit;
  bool daemon = false;
  bool no_api = false;
  bool dry_run = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "--port") {
      opts.port = require_value(i, argc, argv, arg);
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, arg);
    } else if (arg == "--state") {
      opts.state = require_value(i, argc, argv, arg);
    } else if (arg == "--key") {
      opts.key = require_value(i, argc, argv, arg);
    } else if (arg == "--limit") {
      opts.limit = require_value(i, argc, argv, arg);
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (arg == "--no-api") {
      opts.no_api = true;
    } else if (arg == "--dry-run") {
      opts.dry_run = true;
    } else if (arg.starts_with("-")) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else if (opts.positional.empty()) {
      opts.positional = arg;
    } else {
      std::println(stderr, "Unexpected argument: {}", arg);
      std::exit(1);
    }
  }

  return opts;
}

auto parse_number(const std::string& text, std::string_view flag,
                  unsigned long max) -> unsigned long {
  unsigned long value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc{} && end == text.data() + text.size() && value <= max) {
    return value;
  }
  std::println(stderr, "Error: invalid value for {}: {}", flag, text);
  std::exit(1);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.command.empty() || opts.command == "serve") {
    adminq::cli::ServeOptions serve;
    serve.config_file = opts.config_file;
    serve.no_api = opts.no_api;
    serve.daemon = opts.daemon;
    serve.dry_run = opts.dry_run;
    if (!opts.log_file.empty()) serve.log_file = opts.log_file;
    if (!opts.db_file.empty()) serve.db_file = opts.db_file;
    if (!opts.port.empty()) {
      serve.port = static_cast<uint16_t>(parse_number(opts.port, "--port", 65535));
    }
    return adminq::cli::cmd_serve(serve);
  }

  if (opts.command == "status") {
    adminq::cli::StatusOptions status;
    if (!opts.db_file.empty()) status.db_file = opts.db_file;
    status.task_id = opts.positional;
    return adminq::cli::cmd_status(status);
  }

  if (opts.command == "list") {
    adminq::cli::ListOptions list;
    if (!opts.db_file.empty()) list.db_file = opts.db_file;
    list.state = opts.state;
    list.key = opts.key;
    if (!opts.limit.empty()) {
      list.limit = parse_number(opts.limit, "--limit", 1'000'000);
    }
    return adminq::cli::cmd_list(list);
  }

  if (opts.command == "validate") {
    adminq::cli::ValidateOptions validate;
    validate.config_file =
        opts.positional.empty() ? opts.config_file : opts.positional;
    if (validate.config_file.empty()) {
      std::println(stderr, "Error: validate requires a config file");
      return 1;
    }
    return adminq::cli::cmd_validate(validate);
  }

  std::println(stderr, "Unknown command: {}", opts.command);
  print_usage(argv[0]);
  return 1;
}
