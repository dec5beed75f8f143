#include "pipeaudit/storage/audit_history.h"

#include "pipeaudit/report/report_assembler.h"

#include <algorithm>

namespace pipeaudit::storage {

AuditRunRecord make_run_record(const audit::AuditReport& report, const std::string& report_path) {
  const auto counts = audit::count_levels(report.findings);

  AuditRunRecord record;
  record.run_id = report.run_id;
  record.started_at = report.started_at;
  record.completed_at = report.completed_at;
  record.root = report.root;
  record.status = std::string(audit::to_string(audit::compute_status(report.findings)));
  record.report_path = report_path;
  record.ok_count = counts.ok;
  record.info_count = counts.info;
  record.warn_count = counts.warn;
  record.error_count = counts.error;
  record.report_json = report::render_report(report, -1);
  return record;
}

core::Result<bool, std::string> InMemoryAuditHistory::record_run(
    const audit::AuditReport& report, const std::string& report_path) {
  if (runs_.find(report.run_id) != runs_.end()) {
    return core::Result<bool, std::string>::err("run already recorded: " + report.run_id);
  }
  runs_[report.run_id] = make_run_record(report, report_path);
  findings_[report.run_id] = report.findings;
  return core::Result<bool, std::string>::ok(true);
}

std::vector<AuditRunRecord> InMemoryAuditHistory::list_runs(const std::size_t limit) const {
  std::vector<AuditRunRecord> result;
  for (const auto& [id, record] : runs_) {
    result.push_back(record);
  }
  std::sort(result.begin(), result.end(), [](const AuditRunRecord& a, const AuditRunRecord& b) {
    if (a.started_at != b.started_at) {
      return a.started_at > b.started_at;
    }
    return a.run_id > b.run_id;
  });
  if (result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

std::optional<AuditRunRecord> InMemoryAuditHistory::get_run(const std::string& run_id) const {
  auto it = runs_.find(run_id);
  if (it != runs_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<audit::Finding> InMemoryAuditHistory::findings_for_run(
    const std::string& run_id) const {
  auto it = findings_.find(run_id);
  if (it != findings_.end()) {
    return it->second;
  }
  return {};
}

}  // namespace pipeaudit::storage
