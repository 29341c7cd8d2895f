#pragma once

#include "orchestra/storage/state_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace orchestra {

// SQLite engine. Several processes may share one database file: task moves
// are single conditional UPDATEs inside BEGIN IMMEDIATE transactions, and
// the connection runs in WAL mode with a busy timeout.
class SqliteStateStore final : public StateStore {
public:
  explicit SqliteStateStore(
      std::string_view db_path,
      std::chrono::milliseconds busy_timeout = std::chrono::milliseconds{5000});
  ~SqliteStateStore() override;

  SqliteStateStore(const SqliteStateStore&) = delete;
  SqliteStateStore& operator=(const SqliteStateStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto create_run(const NewRun& run) -> Result<RunId> override;
  [[nodiscard]] auto get_run(const RunId& run_id) -> Result<RunRecord> override;
  [[nodiscard]] auto get_run_state(const RunId& run_id)
      -> Result<RunState> override;
  [[nodiscard]] auto transition_task(const RunId& run_id,
                                     const TaskId& task_id,
                                     const TaskTransition& t)
      -> Result<bool> override;
  [[nodiscard]] auto record_task_output(const RunId& run_id,
                                        const TaskId& task_id,
                                        std::string_view port,
                                        const ArtifactData& artifact)
      -> Result<void> override;
  [[nodiscard]] auto transition_run(const RunId& run_id, RunStatus expected,
                                    RunStatus next) -> Result<bool> override;
  [[nodiscard]] auto request_cancel(const RunId& run_id)
      -> Result<bool> override;
  [[nodiscard]] auto list_incomplete_runs()
      -> Result<std::vector<RunId>> override;
  [[nodiscard]] auto list_attempts(const RunId& run_id, const TaskId& task_id)
      -> Result<std::vector<TaskAttempt>> override;
  [[nodiscard]] auto list_runs(std::size_t limit)
      -> Result<std::vector<RunRecord>> override;

private:
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

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(std::string_view sql) -> Result<Statement>;

  [[nodiscard]] auto begin_immediate() -> Result<void>;
  [[nodiscard]] auto begin_read() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  auto rollback_transaction() -> void;

  // Runs body inside a transaction; commits on success, rolls back on error.
  template <typename F>
  auto in_transaction(bool write, F&& body) -> decltype(body());

  [[nodiscard]] auto read_run(const RunId& run_id) -> Result<RunRecord>;
  [[nodiscard]] auto run_exists(const RunId& run_id) -> Result<bool>;
  [[nodiscard]] auto task_exists(const RunId& run_id, const TaskId& task_id)
      -> Result<bool>;

  std::string db_path_;
  std::chrono::milliseconds busy_timeout_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
  std::mutex mu_;
};

}  // namespace orchestra
