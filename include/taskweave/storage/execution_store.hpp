#pragma once

#include "taskweave/core/error.hpp"
#include "taskweave/util/id.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace taskweave {

enum class ExecutionStatus : std::uint8_t {
  Pending,
  Running,
  Paused,
  Completed,
  Failed,
  Cancelled,
};

[[nodiscard]] constexpr auto to_string_view(ExecutionStatus status) noexcept
    -> std::string_view {
  switch (status) {
    case ExecutionStatus::Pending:
      return "pending";
    case ExecutionStatus::Running:
      return "running";
    case ExecutionStatus::Paused:
      return "paused";
    case ExecutionStatus::Completed:
      return "completed";
    case ExecutionStatus::Failed:
      return "failed";
    case ExecutionStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

[[nodiscard]] auto parse_execution_status(std::string_view s) noexcept
    -> std::optional<ExecutionStatus>;

// Running and paused executions may still commit to their branch.
[[nodiscard]] constexpr auto is_active(ExecutionStatus status) noexcept
    -> bool {
  return status == ExecutionStatus::Running ||
         status == ExecutionStatus::Paused;
}

struct ExecutionRecord {
  ExecutionId id;
  std::string issue_id;
  ExecutionStatus status{ExecutionStatus::Pending};
  std::string worktree_path;
  std::string branch_name;
  std::string target_branch;
  std::string stream_id;
  std::string before_commit;
  std::string after_commit;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};
};

class IExecutionStore {
public:
  virtual ~IExecutionStore() = default;

  // Insert or replace.
  [[nodiscard]] virtual auto save(const ExecutionRecord& record)
      -> Result<void> = 0;
  // Error::NotFound when absent.
  [[nodiscard]] virtual auto get(const ExecutionId& id)
      -> Result<ExecutionRecord> = 0;
  [[nodiscard]] virtual auto update_status(const ExecutionId& id,
                                           ExecutionStatus status)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto update_after_commit(const ExecutionId& id,
                                                 std::string_view sha)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto list() -> Result<std::vector<ExecutionRecord>> = 0;
};

class SqliteExecutionStore final : public IExecutionStore {
public:
  explicit SqliteExecutionStore(std::string_view db_path);
  ~SqliteExecutionStore() override;

  SqliteExecutionStore(const SqliteExecutionStore&) = delete;
  SqliteExecutionStore& operator=(const SqliteExecutionStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto save(const ExecutionRecord& record)
      -> Result<void> override;
  [[nodiscard]] auto get(const ExecutionId& id)
      -> Result<ExecutionRecord> override;
  [[nodiscard]] auto update_status(const ExecutionId& id,
                                   ExecutionStatus status)
      -> Result<void> override;
  [[nodiscard]] auto update_after_commit(const ExecutionId& id,
                                         std::string_view sha)
      -> Result<void> override;
  [[nodiscard]] auto list() -> Result<std::vector<ExecutionRecord>> override;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto update_column(const char* sql, const ExecutionId& id,
                                   std::string_view value) -> Result<void>;

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
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace taskweave
