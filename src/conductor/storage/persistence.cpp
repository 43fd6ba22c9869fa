#include "conductor/storage/persistence.hpp"

#include "conductor/model/serialization.hpp"
#include "conductor/model/state_strings.hpp"
#include "conductor/util/log.hpp"

#include <sqlite3.h>

#include <utility>

namespace conductor {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto encode_signatures(const std::vector<FailureSignature>& sigs)
    -> std::string {
  std::vector<std::string> names;
  names.reserve(sigs.size());
  for (auto sig : sigs) {
    names.emplace_back(to_string_view(sig));
  }
  return encode_string_list(names);
}

auto encode_ids(const std::vector<SubtaskId>& ids) -> std::string {
  std::vector<std::string> names;
  names.reserve(ids.size());
  for (const auto& id : ids) {
    names.push_back(id.str());
  }
  return encode_string_list(names);
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
  if (!db_) {
    return fail(Error::DatabaseError);
  }
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
      description TEXT NOT NULL,
      complexity TEXT NOT NULL DEFAULT 'atomic',
      created_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS pipelines (
      task_id TEXT PRIMARY KEY,
      stage TEXT NOT NULL DEFAULT 'submitted',
      retry_count INTEGER NOT NULL DEFAULT 0,
      max_retries INTEGER NOT NULL DEFAULT 3,
      failure_patterns TEXT NOT NULL DEFAULT '[]',
      reason TEXT DEFAULT '',
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS subtasks (
      id TEXT PRIMARY KEY,
      task_id TEXT NOT NULL,
      position INTEGER NOT NULL,
      description TEXT NOT NULL,
      capability TEXT NOT NULL,
      depends_on TEXT NOT NULL DEFAULT '[]',
      status TEXT NOT NULL DEFAULT 'pending',
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS attempts (
      task_id TEXT NOT NULL,
      seq INTEGER NOT NULL,
      subtask_id TEXT NOT NULL,
      attempt INTEGER NOT NULL,
      strategy TEXT NOT NULL,
      started_at INTEGER,
      finished_at INTEGER,
      outcome TEXT NOT NULL,
      signature TEXT,
      error TEXT DEFAULT '',
      payload TEXT DEFAULT '',
      touched_files TEXT NOT NULL DEFAULT '[]',
      PRIMARY KEY (task_id, seq),
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS stage_transitions (
      task_id TEXT NOT NULL,
      seq INTEGER NOT NULL,
      from_stage TEXT NOT NULL,
      to_stage TEXT NOT NULL,
      at INTEGER NOT NULL,
      PRIMARY KEY (task_id, seq),
      FOREIGN KEY (task_id) REFERENCES tasks(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_subtasks_task
      ON subtasks(task_id, position);
    CREATE INDEX IF NOT EXISTS idx_pipelines_stage
      ON pipelines(stage);
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
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

auto Persistence::begin_transaction() -> Result<void> {
  return execute("BEGIN TRANSACTION;");
}

auto Persistence::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Persistence::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

auto Persistence::save_snapshot(const Task& task, const PipelineState& state,
                                const std::vector<Subtask>& subtasks)
    -> Result<void> {
  if (auto r = begin_transaction(); !r) {
    return r;
  }

  auto write = [&]() -> Result<void> {
    if (auto r = save_task(task); !r) return r;
    if (auto r = save_pipeline(state); !r) return r;
    if (auto r = save_subtasks(subtasks); !r) return r;
    if (auto r = save_attempts(task.id, state.attempts); !r) return r;
    return save_transitions(task.id, state.transitions);
  };

  if (auto r = write(); !r) {
    log::error("Snapshot of {} failed: {}", task.id, r.error().message());
    (void)rollback_transaction();
    return r;
  }
  return commit_transaction();
}

auto Persistence::save_task(const Task& task) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO tasks (id, description, complexity, created_at)
    VALUES (?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      description = excluded.description,
      complexity = excluded.complexity;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task.id.str());
  bind_text(stmt.get(), 2, task.description);
  bind_text(stmt.get(), 3, to_string_view(task.complexity));
  sqlite3_bind_int64(stmt.get(), 4, to_millis(task.created_at));

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto Persistence::save_pipeline(const PipelineState& state) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO pipelines
      (task_id, stage, retry_count, max_retries, failure_patterns, reason)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT(task_id) DO UPDATE SET
      stage = excluded.stage,
      retry_count = excluded.retry_count,
      max_retries = excluded.max_retries,
      failure_patterns = excluded.failure_patterns,
      reason = excluded.reason;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto patterns = encode_signatures(state.failure_patterns);
  bind_text(stmt.get(), 1, state.task_id.str());
  bind_text(stmt.get(), 2, to_string_view(state.stage));
  sqlite3_bind_int(stmt.get(), 3, state.retry_count);
  sqlite3_bind_int(stmt.get(), 4, state.max_retries);
  bind_text(stmt.get(), 5, patterns);
  bind_text(stmt.get(), 6, state.reason);

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto Persistence::save_subtasks(const std::vector<Subtask>& subtasks)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO subtasks
      (id, task_id, position, description, capability, depends_on, status)
    VALUES (?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      position = excluded.position,
      description = excluded.description,
      capability = excluded.capability,
      depends_on = excluded.depends_on,
      status = excluded.status;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  for (std::size_t i = 0; i < subtasks.size(); ++i) {
    const auto& s = subtasks[i];
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());

    auto deps = encode_ids(s.depends_on);
    bind_text(stmt.get(), 1, s.id.str());
    bind_text(stmt.get(), 2, s.task_id.str());
    sqlite3_bind_int(stmt.get(), 3, static_cast<int>(i));
    bind_text(stmt.get(), 4, s.description);
    bind_text(stmt.get(), 5, s.capability);
    bind_text(stmt.get(), 6, deps);
    bind_text(stmt.get(), 7, to_string_view(s.status));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto Persistence::save_attempts(const TaskId& task_id,
                                const std::vector<AgentAttempt>& attempts)
    -> Result<void> {
  // Attempts are append-only; rows already stored are left alone.
  constexpr auto sql = R"(
    INSERT INTO attempts
      (task_id, seq, subtask_id, attempt, strategy, started_at, finished_at,
       outcome, signature, error, payload, touched_files)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(task_id, seq) DO NOTHING;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  for (std::size_t i = 0; i < attempts.size(); ++i) {
    const auto& a = attempts[i];
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());

    auto touched = encode_string_list(a.touched_files);
    bind_text(stmt.get(), 1, task_id.str());
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(i));
    bind_text(stmt.get(), 3, a.subtask_id.str());
    sqlite3_bind_int(stmt.get(), 4, a.attempt);
    bind_text(stmt.get(), 5, to_string_view(a.strategy));
    sqlite3_bind_int64(stmt.get(), 6, to_millis(a.started_at));
    sqlite3_bind_int64(stmt.get(), 7, to_millis(a.finished_at));
    bind_text(stmt.get(), 8, to_string_view(a.outcome));
    if (a.signature) {
      bind_text(stmt.get(), 9, to_string_view(*a.signature));
    } else {
      sqlite3_bind_null(stmt.get(), 9);
    }
    bind_text(stmt.get(), 10, a.error);
    bind_text(stmt.get(), 11, a.payload);
    bind_text(stmt.get(), 12, touched);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto Persistence::save_transitions(
    const TaskId& task_id, const std::vector<StageTransition>& transitions)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO stage_transitions (task_id, seq, from_stage, to_stage, at)
    VALUES (?, ?, ?, ?, ?)
    ON CONFLICT(task_id, seq) DO NOTHING;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  for (std::size_t i = 0; i < transitions.size(); ++i) {
    const auto& t = transitions[i];
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());

    bind_text(stmt.get(), 1, task_id.str());
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(i));
    bind_text(stmt.get(), 3, to_string_view(t.from));
    bind_text(stmt.get(), 4, to_string_view(t.to));
    sqlite3_bind_int64(stmt.get(), 5, to_millis(t.at));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto Persistence::get_task(std::string_view task_id) -> Result<TaskRow> {
  constexpr auto sql =
      "SELECT id, description, complexity, created_at FROM tasks WHERE id = ?;";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task_id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);

  return TaskRow{
      .id = col_text(stmt.get(), 0),
      .description = col_text(stmt.get(), 1),
      .complexity = col_text(stmt.get(), 2),
      .created_at = sqlite3_column_int64(stmt.get(), 3),
  };
}

auto Persistence::get_pipeline(std::string_view task_id)
    -> Result<PipelineRow> {
  constexpr auto sql = R"(
    SELECT task_id, stage, retry_count, max_retries, failure_patterns, reason
    FROM pipelines WHERE task_id = ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task_id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);

  return PipelineRow{
      .task_id = col_text(stmt.get(), 0),
      .stage = col_text(stmt.get(), 1),
      .retry_count = sqlite3_column_int(stmt.get(), 2),
      .max_retries = sqlite3_column_int(stmt.get(), 3),
      .failure_patterns = col_text(stmt.get(), 4),
      .reason = col_text(stmt.get(), 5),
  };
}

auto Persistence::get_subtasks(std::string_view task_id)
    -> Result<std::vector<SubtaskRow>> {
  constexpr auto sql = R"(
    SELECT id, task_id, description, capability, depends_on, status
    FROM subtasks WHERE task_id = ? ORDER BY position;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task_id);
  std::vector<SubtaskRow> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    rows.push_back(SubtaskRow{
        .id = col_text(stmt.get(), 0),
        .task_id = col_text(stmt.get(), 1),
        .description = col_text(stmt.get(), 2),
        .capability = col_text(stmt.get(), 3),
        .depends_on = col_text(stmt.get(), 4),
        .status = col_text(stmt.get(), 5),
    });
  }
  return rows;
}

auto Persistence::get_attempts(std::string_view task_id)
    -> Result<std::vector<AttemptRow>> {
  constexpr auto sql = R"(
    SELECT subtask_id, attempt, strategy, started_at, finished_at, outcome,
           signature, error, payload, touched_files
    FROM attempts WHERE task_id = ? ORDER BY seq;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task_id);
  std::vector<AttemptRow> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    rows.push_back(AttemptRow{
        .subtask_id = col_text(stmt.get(), 0),
        .attempt = sqlite3_column_int(stmt.get(), 1),
        .strategy = col_text(stmt.get(), 2),
        .started_at = sqlite3_column_int64(stmt.get(), 3),
        .finished_at = sqlite3_column_int64(stmt.get(), 4),
        .outcome = col_text(stmt.get(), 5),
        .signature = col_text(stmt.get(), 6),
        .error = col_text(stmt.get(), 7),
        .payload = col_text(stmt.get(), 8),
        .touched_files = col_text(stmt.get(), 9),
    });
  }
  return rows;
}

auto Persistence::get_transitions(std::string_view task_id)
    -> Result<std::vector<TransitionRow>> {
  constexpr auto sql = R"(
    SELECT from_stage, to_stage, at
    FROM stage_transitions WHERE task_id = ? ORDER BY seq;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, task_id);
  std::vector<TransitionRow> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    rows.push_back(TransitionRow{
        .from = col_text(stmt.get(), 0),
        .to = col_text(stmt.get(), 1),
        .at = sqlite3_column_int64(stmt.get(), 2),
    });
  }
  return rows;
}

auto Persistence::get_incomplete_tasks() -> Result<std::vector<std::string>> {
  constexpr auto sql = R"(
    SELECT task_id FROM pipelines
    WHERE stage NOT IN ('complete', 'failed', 'escalated')
    ORDER BY task_id;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    if (auto id = col_text(stmt.get(), 0); !id.empty()) {
      ids.emplace_back(std::move(id));
    }
  }
  return ids;
}

}  // namespace conductor
