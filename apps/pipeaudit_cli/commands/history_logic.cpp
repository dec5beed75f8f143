#include "history_logic.h"

#include "audit_logic.h"

namespace pipeaudit::cli {

int execute_list_runs(const storage::IAuditHistory& history, const std::size_t limit,
                      std::ostream& out) {
  const auto runs = history.list_runs(limit);
  if (runs.empty()) {
    out << "no recorded runs\n";
    return 0;
  }

  for (const auto& run : runs) {
    out << run.run_id << "  " << run.started_at << "  " << run.status << "  OK=" << run.ok_count
        << " INFO=" << run.info_count << " WARN=" << run.warn_count
        << " ERROR=" << run.error_count << "  " << run.report_path << "\n";
  }
  return 0;
}

int execute_show_run(const storage::IAuditHistory& history, const std::string& run_id,
                     const bool color, std::ostream& out, std::ostream& err) {
  const auto run = history.get_run(run_id);
  if (!run.has_value()) {
    err << "Run not found: " << run_id << "\n";
    return 1;
  }

  out << "Run:    " << run->run_id << "\n";
  out << "Root:   " << run->root << "\n";
  out << "Window: " << run->started_at << " .. " << run->completed_at << "\n";
  for (const auto& finding : history.findings_for_run(run_id)) {
    out << format_finding_line(finding, color) << "\n";
  }
  out << "Report: " << run->report_path << "\n";
  out << "STATUS: " << run->status << "\n";
  return 0;
}

}  // namespace pipeaudit::cli
