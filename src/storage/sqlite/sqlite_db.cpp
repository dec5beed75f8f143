#include "pipeaudit/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <cstddef>
#include <utility>

namespace pipeaudit::storage::sqlite {

namespace {

using ExecResult = core::Result<bool, std::string>;

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS audit_runs (
  run_id TEXT PRIMARY KEY,
  started_at TEXT NOT NULL,
  completed_at TEXT NOT NULL,
  root TEXT NOT NULL,
  status TEXT NOT NULL CHECK(status IN ('READY', 'DEGRADED', 'NEEDS_FIXES')),
  report_path TEXT NOT NULL,
  ok_count INTEGER NOT NULL,
  info_count INTEGER NOT NULL,
  warn_count INTEGER NOT NULL,
  error_count INTEGER NOT NULL,
  report_json TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_runs_started ON audit_runs(started_at);

CREATE TABLE IF NOT EXISTS audit_findings (
  run_id TEXT NOT NULL,
  idx INTEGER NOT NULL,
  level TEXT NOT NULL,
  kind TEXT NOT NULL,
  resource_id TEXT NOT NULL,
  message TEXT NOT NULL,
  produced_at TEXT NOT NULL,
  PRIMARY KEY(run_id, idx),
  FOREIGN KEY(run_id) REFERENCES audit_runs(run_id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_audit_findings_resource ON audit_findings(resource_id);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, strftime('%Y-%m-%dT%H:%M:%SZ', 'now'));
)";

// Runs sql on a raw connection; the error text is prefixed with what.
ExecResult exec_on(sqlite3* db, const char* sql, const std::string& what) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    const std::string error = err_msg != nullptr ? err_msg : sqlite3_errmsg(db);
    sqlite3_free(err_msg);
    return ExecResult::err(what + ": " + error);
  }
  return ExecResult::ok(true);
}

}  // namespace

void SqliteDb::ConnectionCloser::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    const std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("cannot open " + path + ": " + error);
  }

  // Owned from here on; closed on every return path.
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));

  auto fk = exec_on(raw, "PRAGMA foreign_keys = ON;", "cannot enable foreign keys");
  if (!fk.has_value()) {
    return OpenResult::err(fk.error());
  }
  // Waits up to 2 s for a concurrent writer.
  sqlite3_busy_timeout(raw, 2000);

  return OpenResult::ok(std::move(db));
}

int SqliteDb::schema_version() const {
  Statement stmt(*this, "SELECT MAX(version) FROM schema_version");
  if (!stmt.ok()) {
    return 0;  // table not created yet
  }
  if (stmt.step() != Statement::StepResult::kRow) {
    return 0;
  }
  return static_cast<int>(stmt.int_at(0));
}

ExecResult SqliteDb::ensure_schema_v1() {
  if (schema_version() >= 1) {
    return ExecResult::ok(true);
  }
  return exec_on(db_.get(), kSchemaV1, "cannot apply schema v1");
}

ExecResult SqliteDb::exec(const std::string& sql) {
  return exec_on(db_.get(), sql.c_str(), "statement failed");
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

// ── Statement ───────────────────────────────────────────────────────────────

void Statement::StatementFinalizer::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

Statement::Statement(const SqliteDb& db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db.connection(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = db.last_error();
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

void Statement::bind(const int index, const std::string& value) {
  if (stmt_) {
    sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
  }
}

void Statement::bind(const int index, const std::int64_t value) {
  if (stmt_) {
    sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
  }
}

Statement::StepResult Statement::step() {
  if (!stmt_) {
    return StepResult::kError;
  }
  switch (sqlite3_step(stmt_.get())) {
    case SQLITE_ROW:
      return StepResult::kRow;
    case SQLITE_DONE:
      return StepResult::kDone;
    default:
      return StepResult::kError;
  }
}

void Statement::rewind() {
  if (stmt_) {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
  }
}

std::string Statement::text_at(const int column) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), column);
  if (raw == nullptr) {
    return {};
  }
  return {reinterpret_cast<const char*>(raw),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
          static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column))};
}

std::int64_t Statement::int_at(const int column) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), column));
}

// ── Transaction ─────────────────────────────────────────────────────────────

Transaction::Transaction(SqliteDb& db) : db_(db) {
  auto begun = db_.exec("BEGIN IMMEDIATE;");
  if (begun.has_value()) {
    active_ = true;
  } else {
    begin_error_ = begun.error();
  }
}

Transaction::~Transaction() {
  if (active_) {
    sqlite3_exec(db_.connection(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

ExecResult Transaction::commit() {
  if (!active_) {
    return ExecResult::err(begin_error_.empty() ? "transaction not active" : begin_error_);
  }
  auto committed = db_.exec("COMMIT;");
  if (committed.has_value()) {
    active_ = false;
  }
  return committed;
}

}  // namespace pipeaudit::storage::sqlite
