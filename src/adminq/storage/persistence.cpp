#include "adminq/storage/persistence.hpp"

#include "adminq/storage/state_strings.hpp"
#include "adminq/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <chrono>
#include <optional>
#include <utility>

namespace adminq {

namespace {

auto to_timestamp(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto from_timestamp(std::int64_t ts) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ts));
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_timestamp(sqlite3_stmt* stmt, int col)
    -> std::optional<std::chrono::system_clock::time_point> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return from_timestamp(sqlite3_column_int64(stmt, col));
}

auto bind_timestamp(sqlite3_stmt* stmt, int idx,
                    const std::optional<std::chrono::system_clock::time_point>& tp)
    -> void {
  if (tp) {
    sqlite3_bind_int64(stmt, idx, to_timestamp(*tp));
  } else {
    sqlite3_bind_null(stmt, idx);
  }
}

auto parse_json_or(const std::string& text, nlohmann::json fallback)
    -> nlohmann::json {
  if (text.empty()) {
    return fallback;
  }
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  return parsed.is_discarded() ? fallback : parsed;
}

constexpr auto kSelectTask = R"(
  SELECT id, kind, key, params, state, attempt_count, seq, created_at,
         started_at, finished_at, result, cancel_requested, progress,
         current_step, revision
  FROM tasks
)";

auto read_task_row(sqlite3_stmt* stmt) -> std::optional<Task> {
  auto kind = parse_task_kind(col_text(stmt, 1));
  auto state = parse_task_state(col_text(stmt, 4));
  if (!kind || !state) {
    return std::nullopt;
  }

  Task task;
  task.id = TaskId{col_text(stmt, 0)};
  task.kind = *kind;
  task.key = col_text(stmt, 2);
  task.params = parse_json_or(col_text(stmt, 3), nlohmann::json::object());
  task.state = *state;
  task.attempt_count = sqlite3_column_int(stmt, 5);
  task.sequence = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
  task.created_at = from_timestamp(sqlite3_column_int64(stmt, 7));
  task.started_at = col_timestamp(stmt, 8);
  task.finished_at = col_timestamp(stmt, 9);
  if (sqlite3_column_type(stmt, 10) != SQLITE_NULL) {
    task.result = parse_json_or(col_text(stmt, 10), nullptr);
  }
  task.cancel_requested = sqlite3_column_int(stmt, 11) != 0;
  task.progress = sqlite3_column_int(stmt, 12);
  task.current_step = col_text(stmt, 13);
  task.revision = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 14));
  return task;
}

}  // namespace

auto Persistence::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Persistence::Statement::~Statement() {
  reset();
}

auto Persistence::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto Persistence::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

Persistence::Persistence(std::string_view db_path) : db_path_(db_path) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  // PRAGMA statements may fail on some configurations, but we continue anyway
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto Persistence::close() -> void {
  db_.reset();
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      kind TEXT NOT NULL,
      key TEXT NOT NULL,
      params TEXT NOT NULL DEFAULT '{}',
      state TEXT NOT NULL DEFAULT 'pending',
      attempt_count INTEGER NOT NULL DEFAULT 0,
      seq INTEGER NOT NULL DEFAULT 0,
      created_at INTEGER NOT NULL,
      started_at INTEGER,
      finished_at INTEGER,
      result TEXT,
      cancel_requested INTEGER NOT NULL DEFAULT 0,
      progress INTEGER NOT NULL DEFAULT 0,
      current_step TEXT NOT NULL DEFAULT '',
      revision INTEGER NOT NULL DEFAULT 0
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_state ON tasks(state);
    CREATE INDEX IF NOT EXISTS idx_tasks_key ON tasks(key);

    CREATE TABLE IF NOT EXISTS task_logs (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      task_id TEXT NOT NULL,
      timestamp INTEGER NOT NULL,
      message TEXT NOT NULL,
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_task_logs_task ON task_logs(task_id);
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::write_task_row(const Task& task) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO tasks (id, kind, key, params, state, attempt_count, seq,
                       created_at, started_at, finished_at, result,
                       cancel_requested, progress, current_step, revision)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      state = excluded.state,
      attempt_count = excluded.attempt_count,
      started_at = excluded.started_at,
      finished_at = excluded.finished_at,
      result = excluded.result,
      cancel_requested = excluded.cancel_requested,
      progress = excluded.progress,
      current_step = excluded.current_step,
      revision = excluded.revision;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto params = task.params.dump();
  sqlite3_bind_text(stmt.get(), 1, task.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, task_kind_name(task.kind), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, task.key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, params.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, task_state_name(task.state), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 6, task.attempt_count);
  sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(task.sequence));
  sqlite3_bind_int64(stmt.get(), 8, to_timestamp(task.created_at));
  bind_timestamp(stmt.get(), 9, task.started_at);
  bind_timestamp(stmt.get(), 10, task.finished_at);
  if (task.result) {
    auto text = task.result->dump();
    sqlite3_bind_text(stmt.get(), 11, text.c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt.get(), 11);
  }
  sqlite3_bind_int(stmt.get(), 12, task.cancel_requested ? 1 : 0);
  sqlite3_bind_int(stmt.get(), 13, task.progress);
  sqlite3_bind_text(stmt.get(), 14, task.current_step.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 15, static_cast<sqlite3_int64>(task.revision));

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto Persistence::write_task_logs(const Task& task) -> Result<void> {
  {
    auto result = prepare("DELETE FROM task_logs WHERE task_id = ?;");
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);
    sqlite3_bind_text(stmt.get(), 1, task.id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }

  if (task.logs.empty()) {
    return ok();
  }

  auto result = prepare(
      "INSERT INTO task_logs (task_id, timestamp, message) VALUES (?, ?, ?);");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  for (const auto& entry : task.logs) {
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    sqlite3_bind_text(stmt.get(), 1, task.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, to_timestamp(entry.at));
    sqlite3_bind_text(stmt.get(), 3, entry.message.c_str(), -1,
                      SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto Persistence::save_task(const Task& task) -> Result<void> {
  if (auto r = begin_transaction(); !r) {
    return r;
  }

  auto r = write_task_row(task);
  if (r) {
    r = write_task_logs(task);
  }
  if (!r) {
    if (auto rb = rollback_transaction(); !rb) {
      log::warn("Rollback failed after saving task {}", task.id);
    }
    return r;
  }
  return commit_transaction();
}

auto Persistence::erase_task_rows(const TaskId& id) -> Result<void> {
  for (const char* sql : {"DELETE FROM task_logs WHERE task_id = ?;",
                          "DELETE FROM tasks WHERE id = ?;"}) {
    auto result = prepare(sql);
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);
    sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto Persistence::delete_tasks(const std::vector<TaskId>& ids)
    -> Result<void> {
  if (ids.empty()) {
    return ok();
  }
  if (auto r = begin_transaction(); !r) {
    return r;
  }
  for (const auto& id : ids) {
    if (auto r = erase_task_rows(id); !r) {
      if (auto rb = rollback_transaction(); !rb) {
        log::warn("Rollback failed after deleting task {}", id);
      }
      return r;
    }
  }
  return commit_transaction();
}

auto Persistence::read_logs(const TaskId& id)
    -> Result<std::vector<TaskLogEntry>> {
  auto result = prepare(
      "SELECT timestamp, message FROM task_logs WHERE task_id = ? ORDER BY id;");
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<TaskLogEntry> logs;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    logs.push_back({.at = from_timestamp(sqlite3_column_int64(stmt.get(), 0)),
                    .message = col_text(stmt.get(), 1)});
  }
  return logs;
}

auto Persistence::get_task(const TaskId& id) -> Result<Task> {
  std::string sql = std::string(kSelectTask) + " WHERE id = ?;";
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_text(stmt.get(), 1, id.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::NotFound);
  }
  auto task = read_task_row(stmt.get());
  if (!task) {
    return fail(Error::ParseError);
  }
  if (auto logs = read_logs(task->id); logs) {
    task->logs = std::move(*logs);
  }
  return std::move(*task);
}

auto Persistence::load_tasks() -> Result<std::vector<Task>> {
  std::string sql = std::string(kSelectTask) + " ORDER BY seq;";
  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<Task> tasks;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    auto task = read_task_row(stmt.get());
    if (!task) {
      log::warn("Skipping unreadable task row {}", col_text(stmt.get(), 0));
      continue;
    }
    tasks.push_back(std::move(*task));
  }

  for (auto& task : tasks) {
    auto logs = read_logs(task.id);
    if (!logs) {
      return std::unexpected(logs.error());
    }
    task.logs = std::move(*logs);
  }
  return tasks;
}

auto Persistence::begin_transaction() -> Result<void> {
  return execute("BEGIN TRANSACTION;");
}

auto Persistence::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Persistence::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

}  // namespace adminq
