#include "pipeaudit/storage/sqlite/sqlite_audit_history.h"

#include <cstdint>
#include <utility>

namespace pipeaudit::storage::sqlite {

namespace {

using RecordResult = core::Result<bool, std::string>;
using Step = Statement::StepResult;

constexpr const char* kRunColumns =
    "run_id, started_at, completed_at, root, status, report_path,"
    " ok_count, info_count, warn_count, error_count, report_json";

std::int64_t as_int(const std::size_t n) {
  return static_cast<std::int64_t>(n);
}

std::size_t as_count(const std::int64_t n) {
  return n < 0 ? 0 : static_cast<std::size_t>(n);
}

AuditRunRecord read_run(const Statement& row) {
  AuditRunRecord record;
  record.run_id = row.text_at(0);
  record.started_at = row.text_at(1);
  record.completed_at = row.text_at(2);
  record.root = row.text_at(3);
  record.status = row.text_at(4);
  record.report_path = row.text_at(5);
  record.ok_count = as_count(row.int_at(6));
  record.info_count = as_count(row.int_at(7));
  record.warn_count = as_count(row.int_at(8));
  record.error_count = as_count(row.int_at(9));
  record.report_json = row.text_at(10);
  return record;
}

// Unknown level or kind strings (a newer writer) degrade to INFO / none on replay.
audit::Finding read_finding(const Statement& row) {
  audit::Finding finding;
  finding.level =
      audit::finding_level_from_string(row.text_at(0)).value_or(audit::FindingLevel::kInfo);
  finding.kind =
      audit::finding_kind_from_string(row.text_at(1)).value_or(audit::FindingKind::kNone);
  finding.resource_id = row.text_at(2);
  finding.message = row.text_at(3);
  finding.produced_at = row.text_at(4);
  return finding;
}

}  // namespace

SqliteAuditHistory::SqliteAuditHistory(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

RecordResult SqliteAuditHistory::record_run(const audit::AuditReport& report,
                                            const std::string& report_path) {
  std::lock_guard<std::mutex> lock(mutex_);

  const AuditRunRecord run = make_run_record(report, report_path);

  Transaction tx(*db_);
  if (!tx.begin_error().empty()) {
    return RecordResult::err(tx.begin_error());
  }

  Statement insert_run(*db_, std::string("INSERT INTO audit_runs (") + kRunColumns +
                                 ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  if (!insert_run.ok()) {
    return RecordResult::err("cannot prepare run insert: " + insert_run.error());
  }
  insert_run.bind(1, run.run_id);
  insert_run.bind(2, run.started_at);
  insert_run.bind(3, run.completed_at);
  insert_run.bind(4, run.root);
  insert_run.bind(5, run.status);
  insert_run.bind(6, run.report_path);
  insert_run.bind(7, as_int(run.ok_count));
  insert_run.bind(8, as_int(run.info_count));
  insert_run.bind(9, as_int(run.warn_count));
  insert_run.bind(10, as_int(run.error_count));
  insert_run.bind(11, run.report_json);
  if (insert_run.step() != Step::kDone) {
    return RecordResult::err("cannot record run " + run.run_id + ": " + db_->last_error());
  }

  Statement insert_finding(*db_,
                           "INSERT INTO audit_findings"
                           " (run_id, idx, level, kind, resource_id, message, produced_at)"
                           " VALUES (?, ?, ?, ?, ?, ?, ?)");
  if (!insert_finding.ok()) {
    return RecordResult::err("cannot prepare finding insert: " + insert_finding.error());
  }

  std::int64_t idx = 0;
  for (const auto& finding : report.findings) {
    insert_finding.rewind();
    insert_finding.bind(1, run.run_id);
    insert_finding.bind(2, idx);
    insert_finding.bind(3, std::string(audit::to_string(finding.level)));
    insert_finding.bind(4, std::string(audit::to_string(finding.kind)));
    insert_finding.bind(5, finding.resource_id);
    insert_finding.bind(6, finding.message);
    insert_finding.bind(7, finding.produced_at);
    if (insert_finding.step() != Step::kDone) {
      return RecordResult::err("cannot record finding " + std::to_string(idx) + " of " +
                               run.run_id + ": " + db_->last_error());
    }
    ++idx;
  }

  return tx.commit();
}

std::vector<AuditRunRecord> SqliteAuditHistory::list_runs(const std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement select(*db_, std::string("SELECT ") + kRunColumns +
                             " FROM audit_runs ORDER BY started_at DESC, run_id DESC LIMIT ?");
  select.bind(1, as_int(limit));

  std::vector<AuditRunRecord> runs;
  while (select.step() == Step::kRow) {
    runs.push_back(read_run(select));
  }
  return runs;
}

std::optional<AuditRunRecord> SqliteAuditHistory::get_run(const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement select(*db_,
                   std::string("SELECT ") + kRunColumns + " FROM audit_runs WHERE run_id = ?");
  select.bind(1, run_id);
  if (select.step() != Step::kRow) {
    return std::nullopt;
  }
  return read_run(select);
}

std::vector<audit::Finding> SqliteAuditHistory::findings_for_run(
    const std::string& run_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement select(*db_,
                   "SELECT level, kind, resource_id, message, produced_at"
                   " FROM audit_findings WHERE run_id = ? ORDER BY idx");
  select.bind(1, run_id);

  std::vector<audit::Finding> findings;
  while (select.step() == Step::kRow) {
    findings.push_back(read_finding(select));
  }
  return findings;
}

}  // namespace pipeaudit::storage::sqlite
