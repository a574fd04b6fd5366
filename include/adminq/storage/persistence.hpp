#pragma once

#include "adminq/core/error.hpp"
#include "adminq/queue/task.hpp"
#include "adminq/util/id.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace adminq {

class Persistence {
public:
  explicit Persistence(std::string_view db_path);
  ~Persistence();

  Persistence(const Persistence&) = delete;
  Persistence& operator=(const Persistence&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }
  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return db_path_;
  }

  // Upserts the task row and replaces its log lines in one transaction.
  [[nodiscard]] auto save_task(const Task& task) -> Result<void>;
  [[nodiscard]] auto delete_tasks(const std::vector<TaskId>& ids)
      -> Result<void>;

  [[nodiscard]] auto get_task(const TaskId& id) -> Result<Task>;
  // All rows in submission order, logs included.
  [[nodiscard]] auto load_tasks() -> Result<std::vector<Task>>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto write_task_row(const Task& task) -> Result<void>;
  [[nodiscard]] auto write_task_logs(const Task& task) -> Result<void>;
  [[nodiscard]] auto erase_task_rows(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto read_logs(const TaskId& id)
      -> Result<std::vector<TaskLogEntry>>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    [[nodiscard]] explicit operator bool() const noexcept {
      return stmt_ != nullptr;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace adminq
