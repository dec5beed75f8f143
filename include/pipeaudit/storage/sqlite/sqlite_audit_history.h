#pragma once

#include "pipeaudit/storage/audit_history.h"
#include "pipeaudit/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace pipeaudit::storage::sqlite {

// SqliteAuditHistory implements IAuditHistory on schema v1 (audit_runs, audit_findings).
// A run row and its finding rows are inserted in one transaction; finding order is kept
// in the idx column. Writes are serialized with a mutex.
class SqliteAuditHistory final : public IAuditHistory {
 public:
  explicit SqliteAuditHistory(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> record_run(
      const audit::AuditReport& report, const std::string& report_path) override;
  [[nodiscard]] std::vector<AuditRunRecord> list_runs(std::size_t limit) const override;
  [[nodiscard]] std::optional<AuditRunRecord> get_run(const std::string& run_id) const override;
  [[nodiscard]] std::vector<audit::Finding> findings_for_run(
      const std::string& run_id) const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
};

}  // namespace pipeaudit::storage::sqlite
