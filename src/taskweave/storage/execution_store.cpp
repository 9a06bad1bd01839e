#include "taskweave/storage/execution_store.hpp"

#include "taskweave/util/log.hpp"

#include <sqlite3.h>

#include <array>

namespace taskweave {

namespace {

constexpr std::array kStatusValues = {
    ExecutionStatus::Pending,   ExecutionStatus::Running,
    ExecutionStatus::Paused,    ExecutionStatus::Completed,
    ExecutionStatus::Failed,    ExecutionStatus::Cancelled,
};

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

auto bind_text(sqlite3_stmt* stmt, int col, std::string_view value) -> void {
  sqlite3_bind_text(stmt, col, value.data(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

auto read_record(sqlite3_stmt* stmt) -> ExecutionRecord {
  ExecutionRecord r;
  r.id = ExecutionId{col_text(stmt, 0)};
  r.issue_id = col_text(stmt, 1);
  r.status = parse_execution_status(col_text(stmt, 2))
                 .value_or(ExecutionStatus::Pending);
  r.worktree_path = col_text(stmt, 3);
  r.branch_name = col_text(stmt, 4);
  r.target_branch = col_text(stmt, 5);
  r.stream_id = col_text(stmt, 6);
  r.before_commit = col_text(stmt, 7);
  r.after_commit = col_text(stmt, 8);
  r.created_at = from_timestamp(sqlite3_column_int64(stmt, 9));
  r.updated_at = from_timestamp(sqlite3_column_int64(stmt, 10));
  return r;
}

constexpr auto kSelectColumns = R"(
    SELECT id, issue_id, status, worktree_path, branch_name, target_branch,
           stream_id, before_commit, after_commit, created_at, updated_at
    FROM executions)";

}  // namespace

auto parse_execution_status(std::string_view s) noexcept
    -> std::optional<ExecutionStatus> {
  for (auto status : kStatusValues) {
    if (to_string_view(status) == s) {
      return status;
    }
  }
  return std::nullopt;
}

auto SqliteExecutionStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteExecutionStore::Statement::~Statement() {
  reset();
}

auto SqliteExecutionStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteExecutionStore::SqliteExecutionStore(std::string_view db_path)
    : db_path_(db_path) {
}

SqliteExecutionStore::~SqliteExecutionStore() {
  close();
}

auto SqliteExecutionStore::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database {}: {}", db_path_,
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
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

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::info("Execution store opened: {}", db_path_);
  return ok();
}

auto SqliteExecutionStore::close() -> void {
  db_.reset();
}

auto SqliteExecutionStore::create_tables() -> Result<void> {
  return execute(R"(
    CREATE TABLE IF NOT EXISTS executions (
      id TEXT PRIMARY KEY,
      issue_id TEXT NOT NULL DEFAULT '',
      status TEXT NOT NULL DEFAULT 'pending',
      worktree_path TEXT NOT NULL DEFAULT '',
      branch_name TEXT NOT NULL DEFAULT '',
      target_branch TEXT NOT NULL DEFAULT '',
      stream_id TEXT NOT NULL DEFAULT '',
      before_commit TEXT NOT NULL DEFAULT '',
      after_commit TEXT NOT NULL DEFAULT '',
      created_at INTEGER NOT NULL,
      updated_at INTEGER NOT NULL
    );

    CREATE INDEX IF NOT EXISTS idx_executions_issue ON executions(issue_id);
  )");
}

auto SqliteExecutionStore::execute(std::string_view sql) -> Result<void> {
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

auto SqliteExecutionStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
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

auto SqliteExecutionStore::save(const ExecutionRecord& record) -> Result<void> {
  constexpr auto sql = R"(
    INSERT OR REPLACE INTO executions
      (id, issue_id, status, worktree_path, branch_name, target_branch,
       stream_id, before_commit, after_commit, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
  )";

  if (record.id.empty()) {
    return fail(Error::InvalidArgument);
  }

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto now = std::chrono::system_clock::now();
  auto created = record.created_at.time_since_epoch().count() == 0
                     ? now
                     : record.created_at;

  bind_text(stmt.get(), 1, record.id.value());
  bind_text(stmt.get(), 2, record.issue_id);
  bind_text(stmt.get(), 3, to_string_view(record.status));
  bind_text(stmt.get(), 4, record.worktree_path);
  bind_text(stmt.get(), 5, record.branch_name);
  bind_text(stmt.get(), 6, record.target_branch);
  bind_text(stmt.get(), 7, record.stream_id);
  bind_text(stmt.get(), 8, record.before_commit);
  bind_text(stmt.get(), 9, record.after_commit);
  sqlite3_bind_int64(stmt.get(), 10, to_timestamp(created));
  sqlite3_bind_int64(stmt.get(), 11, to_timestamp(now));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to save execution {}: {}", record.id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteExecutionStore::get(const ExecutionId& id)
    -> Result<ExecutionRecord> {
  static const std::string sql = std::string(kSelectColumns) + " WHERE id = ?;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.value());
  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return read_record(stmt.get());
}

auto SqliteExecutionStore::update_column(const char* sql, const ExecutionId& id,
                                         std::string_view value)
    -> Result<void> {
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, value);
  sqlite3_bind_int64(stmt.get(), 2,
                     to_timestamp(std::chrono::system_clock::now()));
  bind_text(stmt.get(), 3, id.value());

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to update execution {}: {}", id,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  if (sqlite3_changes(db_.get()) == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto SqliteExecutionStore::update_status(const ExecutionId& id,
                                         ExecutionStatus status)
    -> Result<void> {
  return update_column(
      "UPDATE executions SET status = ?, updated_at = ? WHERE id = ?;", id,
      to_string_view(status));
}

auto SqliteExecutionStore::update_after_commit(const ExecutionId& id,
                                               std::string_view sha)
    -> Result<void> {
  return update_column(
      "UPDATE executions SET after_commit = ?, updated_at = ? WHERE id = ?;",
      id, sha);
}

auto SqliteExecutionStore::list() -> Result<std::vector<ExecutionRecord>> {
  static const std::string sql =
      std::string(kSelectColumns) + " ORDER BY created_at, id;";

  auto result = prepare(sql.c_str());
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<ExecutionRecord> records;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    records.push_back(read_record(stmt.get()));
  }
  return records;
}

}  // namespace taskweave
