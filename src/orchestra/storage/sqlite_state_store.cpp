#include "orchestra/storage/sqlite_state_store.hpp"

#include "orchestra/storage/state_strings.hpp"
#include "orchestra/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cstdint>
#include <format>
#include <span>
#include <unordered_map>
#include <variant>
#include <vector>

namespace orchestra {

using json = nlohmann::json;

namespace {

using SqlValue = std::variant<std::nullptr_t, std::int64_t, std::string>;

auto bind_values(sqlite3_stmt* stmt, std::span<const SqlValue> values) -> void {
  int idx = 1;
  for (const auto& v : values) {
    if (const auto* i = std::get_if<std::int64_t>(&v)) {
      sqlite3_bind_int64(stmt, idx, *i);
    } else if (const auto* s = std::get_if<std::string>(&v)) {
      sqlite3_bind_text(stmt, idx, s->c_str(), -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(stmt, idx);
    }
    ++idx;
  }
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_opt_text(sqlite3_stmt* stmt, int col) -> std::optional<std::string> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return col_text(stmt, col);
}

auto col_opt_int(sqlite3_stmt* stmt, int col) -> std::optional<int> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int(stmt, col);
}

auto col_opt_time(sqlite3_stmt* stmt, int col) -> std::optional<Timestamp> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return from_timestamp(sqlite3_column_int64(stmt, col));
}

auto col_json(sqlite3_stmt* stmt, int col) -> json {
  auto parsed = json::parse(col_text(stmt, col), nullptr, false);
  return parsed.is_discarded() ? json::object() : parsed;
}

auto inputs_json(const std::map<std::string, std::string>& inputs) -> std::string {
  return json(inputs).dump();
}

auto inputs_map(const json& j) -> std::map<std::string, std::string> {
  std::map<std::string, std::string> m;
  if (j.is_object()) {
    for (const auto& [k, v] : j.items()) {
      m.emplace(k, v.is_string() ? v.get<std::string>() : v.dump());
    }
  }
  return m;
}

constexpr auto kRunColumns =
    "id, pipeline_name, pipeline_spec, status, inputs, annotations, "
    "cancel_requested, created_at, started_at, finished_at";

auto read_run_row(sqlite3_stmt* stmt) -> RunRecord {
  RunRecord r;
  r.id = RunId{col_text(stmt, 0)};
  r.pipeline_name = col_text(stmt, 1);
  r.pipeline_spec = col_text(stmt, 2);
  r.status = parse_run_status(col_text(stmt, 3));
  r.inputs = inputs_map(col_json(stmt, 4));
  r.annotations = col_json(stmt, 5);
  r.cancel_requested = sqlite3_column_int(stmt, 6) != 0;
  r.created_at = from_timestamp(sqlite3_column_int64(stmt, 7));
  r.started_at = col_opt_time(stmt, 8);
  r.finished_at = col_opt_time(stmt, 9);
  return r;
}

}  // namespace

auto SqliteStateStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteStateStore::Statement::~Statement() {
  reset();
}

auto SqliteStateStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteStateStore::SqliteStateStore(std::string_view db_path,
                                   std::chrono::milliseconds busy_timeout)
    : db_path_(db_path), busy_timeout_(busy_timeout) {
}

SqliteStateStore::~SqliteStateStore() {
  close();
}

auto SqliteStateStore::open() -> Result<void> {
  std::scoped_lock lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(
      db_path_.c_str(), &raw_db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}",
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), static_cast<int>(busy_timeout_.count()));

  // In-memory databases reject WAL; that is fine.
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
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto SqliteStateStore::close() -> void {
  std::scoped_lock lock(mu_);
  db_.reset();
}

auto SqliteStateStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS runs (
      id TEXT PRIMARY KEY,
      pipeline_name TEXT NOT NULL,
      pipeline_spec TEXT NOT NULL,
      status TEXT NOT NULL DEFAULT 'pending',
      inputs TEXT NOT NULL DEFAULT '{}',
      annotations TEXT NOT NULL DEFAULT '{}',
      cancel_requested INTEGER NOT NULL DEFAULT 0,
      created_at INTEGER NOT NULL,
      started_at INTEGER,
      finished_at INTEGER
    );

    CREATE TABLE IF NOT EXISTS task_executions (
      run_id TEXT NOT NULL,
      task_id TEXT NOT NULL,
      position INTEGER NOT NULL,
      status TEXT NOT NULL DEFAULT 'pending',
      attempt INTEGER NOT NULL DEFAULT 0,
      retry_count INTEGER NOT NULL DEFAULT 0,
      infra_retry_count INTEGER NOT NULL DEFAULT 0,
      execution_id TEXT NOT NULL DEFAULT '',
      launcher_handle TEXT NOT NULL DEFAULT '',
      resolved_inputs TEXT NOT NULL DEFAULT '{}',
      cache_key TEXT NOT NULL DEFAULT '',
      exit_code INTEGER,
      error_message TEXT NOT NULL DEFAULT '',
      next_attempt_at INTEGER,
      started_at INTEGER,
      finished_at INTEGER,
      updated_at INTEGER NOT NULL,
      PRIMARY KEY (run_id, task_id),
      FOREIGN KEY (run_id) REFERENCES runs(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS task_outputs (
      run_id TEXT NOT NULL,
      task_id TEXT NOT NULL,
      port TEXT NOT NULL,
      uri TEXT,
      value TEXT,
      created_at INTEGER NOT NULL,
      PRIMARY KEY (run_id, task_id, port),
      FOREIGN KEY (run_id, task_id)
        REFERENCES task_executions(run_id, task_id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS task_attempts (
      run_id TEXT NOT NULL,
      task_id TEXT NOT NULL,
      attempt INTEGER NOT NULL,
      execution_id TEXT NOT NULL DEFAULT '',
      status TEXT NOT NULL,
      launcher_handle TEXT NOT NULL DEFAULT '',
      started_at INTEGER,
      finished_at INTEGER,
      exit_code INTEGER,
      error_message TEXT NOT NULL DEFAULT '',
      PRIMARY KEY (run_id, task_id, attempt),
      FOREIGN KEY (run_id, task_id)
        REFERENCES task_executions(run_id, task_id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_runs_status ON runs(status);
    CREATE INDEX IF NOT EXISTS idx_task_executions_status
      ON task_executions(run_id, status);
  )";

  return execute(sql);
}

auto SqliteStateStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStateStore::prepare(std::string_view sql) -> Result<Statement> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.data(), static_cast<int>(sql.size()),
                         &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return Statement{stmt};
}

auto SqliteStateStore::begin_immediate() -> Result<void> {
  return execute("BEGIN IMMEDIATE;");
}

auto SqliteStateStore::begin_read() -> Result<void> {
  return execute("BEGIN;");
}

auto SqliteStateStore::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto SqliteStateStore::rollback_transaction() -> void {
  if (sqlite3_get_autocommit(db_.get()) == 0) {
    if (auto r = execute("ROLLBACK;"); !r) {
      log::warn("Rollback failed: {}", r.error().message());
    }
  }
}

template <typename F>
auto SqliteStateStore::in_transaction(bool write, F&& body) -> decltype(body()) {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  if (auto r = write ? begin_immediate() : begin_read(); !r) {
    return fail(r.error());
  }
  auto result = body();
  if (!result) {
    rollback_transaction();
    return result;
  }
  if (auto r = commit_transaction(); !r) {
    rollback_transaction();
    return fail(r.error());
  }
  return result;
}

auto SqliteStateStore::run_exists(const RunId& run_id) -> Result<bool> {
  auto stmt = prepare("SELECT 1 FROM runs WHERE id = ?;");
  if (!stmt) {
    return fail(stmt.error());
  }
  bind_text(stmt->get(), 1, run_id.value());
  return sqlite3_step(stmt->get()) == SQLITE_ROW;
}

auto SqliteStateStore::task_exists(const RunId& run_id, const TaskId& task_id)
    -> Result<bool> {
  auto stmt =
      prepare("SELECT 1 FROM task_executions WHERE run_id = ? AND task_id = ?;");
  if (!stmt) {
    return fail(stmt.error());
  }
  bind_text(stmt->get(), 1, run_id.value());
  bind_text(stmt->get(), 2, task_id.value());
  return sqlite3_step(stmt->get()) == SQLITE_ROW;
}

auto SqliteStateStore::read_run(const RunId& run_id) -> Result<RunRecord> {
  auto stmt = prepare(std::format("SELECT {} FROM runs WHERE id = ?;", kRunColumns));
  if (!stmt) {
    return fail(stmt.error());
  }
  bind_text(stmt->get(), 1, run_id.value());
  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_DONE) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_ROW) {
    log::error("Failed to read run {}: {}", run_id, sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return read_run_row(stmt->get());
}

auto SqliteStateStore::create_run(const NewRun& run) -> Result<RunId> {
  std::scoped_lock lock(mu_);
  RunId id = run.id ? *run.id : generate_run_id();
  auto now = to_timestamp(Clock::now());

  return in_transaction(true, [&]() -> Result<RunId> {
    auto stmt = prepare(R"(
      INSERT INTO runs (id, pipeline_name, pipeline_spec, status, inputs,
                        annotations, cancel_requested, created_at)
      VALUES (?, ?, ?, 'pending', ?, ?, 0, ?);
    )");
    if (!stmt) {
      return fail(stmt.error());
    }
    bind_text(stmt->get(), 1, id.value());
    bind_text(stmt->get(), 2, run.pipeline_name);
    bind_text(stmt->get(), 3, run.pipeline_spec);
    bind_text(stmt->get(), 4, inputs_json(run.inputs));
    bind_text(stmt->get(), 5, run.annotations.dump());
    sqlite3_bind_int64(stmt->get(), 6, now);

    int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_CONSTRAINT) {
      return fail(Error::AlreadyExists);
    }
    if (rc != SQLITE_DONE) {
      log::error("Failed to insert run: {}", sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }

    auto task_stmt = prepare(R"(
      INSERT INTO task_executions (run_id, task_id, position, updated_at)
      VALUES (?, ?, ?, ?);
    )");
    if (!task_stmt) {
      return fail(task_stmt.error());
    }
    for (std::size_t i = 0; i < run.task_ids.size(); ++i) {
      sqlite3_reset(task_stmt->get());
      bind_text(task_stmt->get(), 1, id.value());
      bind_text(task_stmt->get(), 2, run.task_ids[i].value());
      sqlite3_bind_int64(task_stmt->get(), 3, static_cast<std::int64_t>(i));
      sqlite3_bind_int64(task_stmt->get(), 4, now);
      if (sqlite3_step(task_stmt->get()) != SQLITE_DONE) {
        log::error("Failed to insert task execution {}: {}", run.task_ids[i],
                   sqlite3_errmsg(db_.get()));
        return fail(Error::DatabaseQueryFailed);
      }
    }
    return id;
  });
}

auto SqliteStateStore::get_run(const RunId& run_id) -> Result<RunRecord> {
  std::scoped_lock lock(mu_);
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  return read_run(run_id);
}

auto SqliteStateStore::get_run_state(const RunId& run_id) -> Result<RunState> {
  std::scoped_lock lock(mu_);

  return in_transaction(false, [&]() -> Result<RunState> {
    auto run = read_run(run_id);
    if (!run) {
      return fail(run.error());
    }

    RunState state;
    state.run = std::move(*run);

    auto stmt = prepare(R"(
      SELECT task_id, status, attempt, retry_count, infra_retry_count,
             execution_id, launcher_handle, resolved_inputs, cache_key,
             exit_code, error_message, next_attempt_at, started_at,
             finished_at, updated_at
      FROM task_executions WHERE run_id = ? ORDER BY position;
    )");
    if (!stmt) {
      return fail(stmt.error());
    }
    bind_text(stmt->get(), 1, run_id.value());

    std::unordered_map<std::string, std::size_t> by_id;
    int rc;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
      auto* s = stmt->get();
      TaskExecution t;
      t.run_id = run_id;
      t.task_id = TaskId{col_text(s, 0)};
      t.status = parse_task_status(col_text(s, 1));
      t.attempt = sqlite3_column_int(s, 2);
      t.retry_count = sqlite3_column_int(s, 3);
      t.infra_retry_count = sqlite3_column_int(s, 4);
      t.execution_id = ExecutionId{col_text(s, 5)};
      t.launcher_handle = col_text(s, 6);
      t.inputs = inputs_from_json(col_json(s, 7));
      t.cache_key = col_text(s, 8);
      t.exit_code = col_opt_int(s, 9);
      t.error_message = col_text(s, 10);
      t.next_attempt_at = col_opt_time(s, 11);
      t.started_at = col_opt_time(s, 12);
      t.finished_at = col_opt_time(s, 13);
      t.updated_at = from_timestamp(sqlite3_column_int64(s, 14));
      by_id.emplace(t.task_id.str(), state.tasks.size());
      state.tasks.push_back(std::move(t));
    }
    if (rc != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }

    auto out_stmt = prepare(
        "SELECT task_id, port, uri, value FROM task_outputs WHERE run_id = ?;");
    if (!out_stmt) {
      return fail(out_stmt.error());
    }
    bind_text(out_stmt->get(), 1, run_id.value());
    while ((rc = sqlite3_step(out_stmt->get())) == SQLITE_ROW) {
      auto* s = out_stmt->get();
      auto it = by_id.find(col_text(s, 0));
      if (it == by_id.end()) {
        continue;
      }
      ArtifactData data;
      data.uri = col_opt_text(s, 2);
      data.value = col_opt_text(s, 3);
      state.tasks[it->second].outputs.emplace(col_text(s, 1), std::move(data));
    }
    if (rc != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
    return state;
  });
}

auto SqliteStateStore::transition_task(const RunId& run_id,
                                       const TaskId& task_id,
                                       const TaskTransition& t)
    -> Result<bool> {
  std::scoped_lock lock(mu_);
  auto now = to_timestamp(Clock::now());

  return in_transaction(true, [&]() -> Result<bool> {
    std::string sql = "UPDATE task_executions SET status = ?, updated_at = ?";
    std::vector<SqlValue> values{std::string(task_status_name(t.next)), now};

    auto set = [&](std::string_view column, SqlValue v) {
      sql += std::format(", {} = ?", column);
      values.push_back(std::move(v));
    };

    if (t.attempt) set("attempt", std::int64_t{*t.attempt});
    if (t.retry_count) set("retry_count", std::int64_t{*t.retry_count});
    if (t.infra_retry_count)
      set("infra_retry_count", std::int64_t{*t.infra_retry_count});
    if (t.execution_id) set("execution_id", t.execution_id->str());
    if (t.launcher_handle) set("launcher_handle", *t.launcher_handle);
    if (t.inputs) set("resolved_inputs", inputs_to_json(*t.inputs).dump());
    if (t.cache_key) set("cache_key", *t.cache_key);
    if (t.next_attempt_at)
      set("next_attempt_at", to_timestamp(*t.next_attempt_at));

    if (t.next == TaskStatus::Starting) {
      set("started_at", now);
      set("finished_at", nullptr);
      if (!t.exit_code) set("exit_code", nullptr);
      if (!t.error_message) set("error_message", std::string{});
    }
    if (t.exit_code) set("exit_code", std::int64_t{*t.exit_code});
    if (t.error_message) set("error_message", *t.error_message);
    if (is_terminal(t.next)) set("finished_at", now);

    sql += " WHERE run_id = ? AND task_id = ? AND status = ?;";
    values.emplace_back(run_id.str());
    values.emplace_back(task_id.str());
    values.emplace_back(std::string(task_status_name(t.expected)));

    auto stmt = prepare(sql);
    if (!stmt) {
      return fail(stmt.error());
    }
    bind_values(stmt->get(), values);
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
      log::error("Failed to update task {}/{}: {}", run_id, task_id,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }

    if (sqlite3_changes(db_.get()) == 0) {
      auto exists = task_exists(run_id, task_id);
      if (!exists) {
        return fail(exists.error());
      }
      if (!*exists) {
        return fail(Error::NotFound);
      }
      return false;
    }

    if (t.next == TaskStatus::Starting) {
      auto attempt_stmt = prepare(R"(
        INSERT OR REPLACE INTO task_attempts
          (run_id, task_id, attempt, execution_id, status, started_at)
        SELECT run_id, task_id, attempt, execution_id, 'starting', ?
        FROM task_executions WHERE run_id = ? AND task_id = ?;
      )");
      if (!attempt_stmt) {
        return fail(attempt_stmt.error());
      }
      sqlite3_bind_int64(attempt_stmt->get(), 1, now);
      bind_text(attempt_stmt->get(), 2, run_id.value());
      bind_text(attempt_stmt->get(), 3, task_id.value());
      if (sqlite3_step(attempt_stmt->get()) != SQLITE_DONE) {
        return fail(Error::DatabaseQueryFailed);
      }
      return true;
    }

    bool closes_attempt = is_in_flight(t.expected) && !is_in_flight(t.next);
    if (!closes_attempt && t.next != TaskStatus::Running) {
      return true;
    }

    auto attempt_stmt = prepare(R"(
      UPDATE task_attempts SET
        status = ?,
        finished_at = COALESCE(?, finished_at),
        launcher_handle = (SELECT e.launcher_handle FROM task_executions e
                           WHERE e.run_id = task_attempts.run_id
                             AND e.task_id = task_attempts.task_id),
        exit_code = (SELECT e.exit_code FROM task_executions e
                     WHERE e.run_id = task_attempts.run_id
                       AND e.task_id = task_attempts.task_id),
        error_message = (SELECT e.error_message FROM task_executions e
                         WHERE e.run_id = task_attempts.run_id
                           AND e.task_id = task_attempts.task_id)
      WHERE run_id = ? AND task_id = ?
        AND attempt = (SELECT attempt FROM task_executions
                       WHERE run_id = ? AND task_id = ?);
    )");
    if (!attempt_stmt) {
      return fail(attempt_stmt.error());
    }
    auto* s = attempt_stmt->get();
    bind_text(s, 1, task_status_name(attempt_outcome(t.next)));
    if (closes_attempt) {
      sqlite3_bind_int64(s, 2, now);
    } else {
      sqlite3_bind_null(s, 2);
    }
    bind_text(s, 3, run_id.value());
    bind_text(s, 4, task_id.value());
    bind_text(s, 5, run_id.value());
    bind_text(s, 6, task_id.value());
    if (sqlite3_step(s) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
    return true;
  });
}

auto SqliteStateStore::record_task_output(const RunId& run_id,
                                          const TaskId& task_id,
                                          std::string_view port,
                                          const ArtifactData& artifact)
    -> Result<void> {
  std::scoped_lock lock(mu_);
  auto stmt = prepare(R"(
    INSERT INTO task_outputs (run_id, task_id, port, uri, value, created_at)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT(run_id, task_id, port) DO UPDATE SET
      uri = excluded.uri,
      value = excluded.value,
      created_at = excluded.created_at;
  )");
  if (!stmt) {
    return fail(stmt.error());
  }
  std::vector<SqlValue> values{
      run_id.str(), task_id.str(), std::string(port),
      artifact.uri ? SqlValue{*artifact.uri} : SqlValue{nullptr},
      artifact.value ? SqlValue{*artifact.value} : SqlValue{nullptr},
      to_timestamp(Clock::now())};
  bind_values(stmt->get(), values);

  int rc = sqlite3_step(stmt->get());
  if (rc == SQLITE_CONSTRAINT) {
    return fail(Error::NotFound);
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to record output {}/{}.{}: {}", run_id, task_id, port,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteStateStore::transition_run(const RunId& run_id, RunStatus expected,
                                      RunStatus next) -> Result<bool> {
  std::scoped_lock lock(mu_);
  auto now = to_timestamp(Clock::now());

  return in_transaction(true, [&]() -> Result<bool> {
    auto stmt = prepare(R"(
      UPDATE runs SET
        status = ?1,
        started_at = CASE WHEN ?1 = 'running' THEN COALESCE(started_at, ?2)
                          ELSE started_at END,
        finished_at = CASE WHEN ?3 THEN ?2 ELSE finished_at END
      WHERE id = ?4 AND status = ?5;
    )");
    if (!stmt) {
      return fail(stmt.error());
    }
    auto* s = stmt->get();
    bind_text(s, 1, run_status_name(next));
    sqlite3_bind_int64(s, 2, now);
    sqlite3_bind_int(s, 3, is_terminal(next) ? 1 : 0);
    bind_text(s, 4, run_id.value());
    bind_text(s, 5, run_status_name(expected));
    if (sqlite3_step(s) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
    if (sqlite3_changes(db_.get()) == 0) {
      auto exists = run_exists(run_id);
      if (!exists) {
        return fail(exists.error());
      }
      if (!*exists) {
        return fail(Error::NotFound);
      }
      return false;
    }
    return true;
  });
}

auto SqliteStateStore::request_cancel(const RunId& run_id) -> Result<bool> {
  std::scoped_lock lock(mu_);

  return in_transaction(true, [&]() -> Result<bool> {
    auto stmt = prepare(R"(
      UPDATE runs SET cancel_requested = 1
      WHERE id = ? AND status IN ('pending', 'running');
    )");
    if (!stmt) {
      return fail(stmt.error());
    }
    bind_text(stmt->get(), 1, run_id.value());
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
    if (sqlite3_changes(db_.get()) == 0) {
      auto exists = run_exists(run_id);
      if (!exists) {
        return fail(exists.error());
      }
      if (!*exists) {
        return fail(Error::NotFound);
      }
      return false;
    }
    return true;
  });
}

auto SqliteStateStore::list_incomplete_runs() -> Result<std::vector<RunId>> {
  std::scoped_lock lock(mu_);
  auto stmt = prepare(R"(
    SELECT id FROM runs WHERE status IN ('pending', 'running')
    ORDER BY created_at, id;
  )");
  if (!stmt) {
    return fail(stmt.error());
  }

  std::vector<RunId> ids;
  while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
    if (auto id = col_text(stmt->get(), 0); !id.empty()) {
      ids.emplace_back(std::move(id));
    }
  }
  return ids;
}

auto SqliteStateStore::list_attempts(const RunId& run_id,
                                     const TaskId& task_id)
    -> Result<std::vector<TaskAttempt>> {
  std::scoped_lock lock(mu_);
  auto exists = task_exists(run_id, task_id);
  if (!exists) {
    return fail(exists.error());
  }
  if (!*exists) {
    return fail(Error::NotFound);
  }

  auto stmt = prepare(R"(
    SELECT attempt, execution_id, status, launcher_handle, started_at,
           finished_at, exit_code, error_message
    FROM task_attempts WHERE run_id = ? AND task_id = ? ORDER BY attempt;
  )");
  if (!stmt) {
    return fail(stmt.error());
  }
  bind_text(stmt->get(), 1, run_id.value());
  bind_text(stmt->get(), 2, task_id.value());

  std::vector<TaskAttempt> attempts;
  while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
    auto* s = stmt->get();
    TaskAttempt a;
    a.attempt = sqlite3_column_int(s, 0);
    a.execution_id = ExecutionId{col_text(s, 1)};
    a.status = parse_task_status(col_text(s, 2));
    a.launcher_handle = col_text(s, 3);
    a.started_at = col_opt_time(s, 4);
    a.finished_at = col_opt_time(s, 5);
    a.exit_code = col_opt_int(s, 6);
    a.error_message = col_text(s, 7);
    attempts.push_back(std::move(a));
  }
  return attempts;
}

auto SqliteStateStore::list_runs(std::size_t limit)
    -> Result<std::vector<RunRecord>> {
  std::scoped_lock lock(mu_);
  auto stmt = prepare(std::format(
      "SELECT {} FROM runs ORDER BY created_at DESC, id DESC LIMIT ?;",
      kRunColumns));
  if (!stmt) {
    return fail(stmt.error());
  }
  sqlite3_bind_int64(stmt->get(), 1, static_cast<std::int64_t>(limit));

  std::vector<RunRecord> runs;
  while (sqlite3_step(stmt->get()) == SQLITE_ROW) {
    runs.push_back(read_run_row(stmt->get()));
  }
  return runs;
}

}  // namespace orchestra
