#pragma once

#include "conductor/core/error.hpp"
#include "conductor/model/types.hpp"
#include "conductor/pipeline/state_tracker.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace conductor {

// Rows as stored. Enum and JSON columns stay text here; Recovery decides
// whether they are readable.
struct TaskRow {
  std::string id;
  std::string description;
  std::string complexity;
  std::int64_t created_at{0};
};

struct PipelineRow {
  std::string task_id;
  std::string stage;
  int retry_count{0};
  int max_retries{0};
  std::string failure_patterns;
  std::string reason;
};

struct SubtaskRow {
  std::string id;
  std::string task_id;
  std::string description;
  std::string capability;
  std::string depends_on;
  std::string status;
};

struct AttemptRow {
  std::string subtask_id;
  int attempt{0};
  std::string strategy;
  std::int64_t started_at{0};
  std::int64_t finished_at{0};
  std::string outcome;
  std::string signature;
  std::string error;
  std::string payload;
  std::string touched_files;
};

struct TransitionRow {
  std::string from;
  std::string to;
  std::int64_t at{0};
};

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

  // Writes the task, its pipeline state, every subtask and any attempts or
  // transitions not yet stored, in one transaction.
  [[nodiscard]] auto save_snapshot(const Task& task, const PipelineState& state,
                                   const std::vector<Subtask>& subtasks)
      -> Result<void>;

  [[nodiscard]] auto get_task(std::string_view task_id) -> Result<TaskRow>;
  [[nodiscard]] auto get_pipeline(std::string_view task_id)
      -> Result<PipelineRow>;
  [[nodiscard]] auto get_subtasks(std::string_view task_id)
      -> Result<std::vector<SubtaskRow>>;
  // Ordered by insertion.
  [[nodiscard]] auto get_attempts(std::string_view task_id)
      -> Result<std::vector<AttemptRow>>;
  [[nodiscard]] auto get_transitions(std::string_view task_id)
      -> Result<std::vector<TransitionRow>>;

  // Tasks whose pipeline has not reached complete, failed or escalated.
  [[nodiscard]] auto get_incomplete_tasks()
      -> Result<std::vector<std::string>>;

  // Raw statement execution, for maintenance and tests.
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  [[nodiscard]] auto save_task(const Task& task) -> Result<void>;
  [[nodiscard]] auto save_pipeline(const PipelineState& state)
      -> Result<void>;
  [[nodiscard]] auto save_subtasks(const std::vector<Subtask>& subtasks)
      -> Result<void>;
  [[nodiscard]] auto save_attempts(const TaskId& task_id,
                                   const std::vector<AgentAttempt>& attempts)
      -> Result<void>;
  [[nodiscard]] auto save_transitions(
      const TaskId& task_id, const std::vector<StageTransition>& transitions)
      -> Result<void>;

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

}  // namespace conductor
