#pragma once

#include "pipeaudit/audit/audit_report.h"
#include "pipeaudit/core/result.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipeaudit::storage {

// AuditRunRecord is the summary row kept for one completed audit run.
struct AuditRunRecord {
  std::string run_id;
  std::string started_at;
  std::string completed_at;
  std::string root;
  std::string status;
  std::string report_path;
  std::size_t ok_count{0};
  std::size_t info_count{0};
  std::size_t warn_count{0};
  std::size_t error_count{0};
  std::string report_json;
};

// make_run_record summarizes a report; status and counts are derived from its findings.
[[nodiscard]] AuditRunRecord make_run_record(const audit::AuditReport& report,
                                             const std::string& report_path);

// IAuditHistory records completed runs and replays their findings.
// Runs are append-only: recording an existing run_id is an error.
class IAuditHistory {
 public:
  virtual ~IAuditHistory() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> record_run(
      const audit::AuditReport& report, const std::string& report_path) = 0;

  // Most recent first (started_at, then run_id, descending).
  [[nodiscard]] virtual std::vector<AuditRunRecord> list_runs(std::size_t limit) const = 0;

  [[nodiscard]] virtual std::optional<AuditRunRecord> get_run(
      const std::string& run_id) const = 0;

  // Findings of one run in their original order.
  [[nodiscard]] virtual std::vector<audit::Finding> findings_for_run(
      const std::string& run_id) const = 0;

 protected:
  IAuditHistory() = default;
  IAuditHistory(const IAuditHistory&) = default;
  IAuditHistory& operator=(const IAuditHistory&) = default;
  IAuditHistory(IAuditHistory&&) = default;
  IAuditHistory& operator=(IAuditHistory&&) = default;
};

// InMemoryAuditHistory keeps runs in a std::map keyed by run_id.
// Suitable for tests and for runs without --history-db.
class InMemoryAuditHistory final : public IAuditHistory {
 public:
  [[nodiscard]] core::Result<bool, std::string> record_run(
      const audit::AuditReport& report, const std::string& report_path) override;
  [[nodiscard]] std::vector<AuditRunRecord> list_runs(std::size_t limit) const override;
  [[nodiscard]] std::optional<AuditRunRecord> get_run(const std::string& run_id) const override;
  [[nodiscard]] std::vector<audit::Finding> findings_for_run(
      const std::string& run_id) const override;

 private:
  std::map<std::string, AuditRunRecord> runs_;
  std::map<std::string, std::vector<audit::Finding>> findings_;
};

}  // namespace pipeaudit::storage
