#pragma once

#include "pipeaudit/core/result.h"

#include <cstdint>
#include <memory>
#include <string>

// sqlite3 stays out of the public API.
struct sqlite3;
struct sqlite3_stmt;

namespace pipeaudit::storage::sqlite {

// SqliteDb owns one connection to the audit history database.
// Opening enables foreign keys; ensure_schema_v1() creates audit_runs and
// audit_findings and records version 1 in schema_version.
// One connection per instance; callers serialize access.
class SqliteDb {
 public:
  // path may be ":memory:".
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied.
  [[nodiscard]] int schema_version() const;

  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Most recent error reported by the connection.
  [[nodiscard]] std::string last_error() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct ConnectionCloser {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, ConnectionCloser> db_;
};

// Statement is a prepared statement with 1-based binds and 0-based columns.
// A statement that failed to prepare reports it through ok()/error(); binds on it are
// ignored and step() returns StepResult::kError.
class Statement {
 public:
  enum class StepResult {
    kRow,    // NOLINT(readability-identifier-naming)
    kDone,   // NOLINT(readability-identifier-naming)
    kError,  // NOLINT(readability-identifier-naming)
  };

  Statement(const SqliteDb& db, const std::string& sql);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  void bind(int index, const std::string& value);
  void bind(int index, std::int64_t value);

  [[nodiscard]] StepResult step();

  // Clears bindings and rewinds so the statement can run again.
  void rewind();

  [[nodiscard]] std::string text_at(int column) const;
  [[nodiscard]] std::int64_t int_at(int column) const;

 private:
  struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StatementFinalizer> stmt_;
  std::string error_;
};

// Transaction opens BEGIN IMMEDIATE on construction and rolls back on destruction
// unless commit() succeeded. A run and its findings are written inside one transaction.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  // Error from BEGIN, if any. A transaction that failed to begin cannot commit.
  [[nodiscard]] const std::string& begin_error() const { return begin_error_; }

  [[nodiscard]] core::Result<bool, std::string> commit();

 private:
  SqliteDb& db_;
  bool active_{false};
  std::string begin_error_;
};

}  // namespace pipeaudit::storage::sqlite
