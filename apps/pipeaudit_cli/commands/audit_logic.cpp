#include "audit_logic.h"

#include "pipeaudit/checks/freshness_checker.h"
#include "pipeaudit/core/version.h"

namespace pipeaudit::cli {

namespace {

const char* level_color(const audit::FindingLevel level) {
  switch (level) {
    case audit::FindingLevel::kOk:
      return "\033[32m";
    case audit::FindingLevel::kInfo:
      return "\033[36m";
    case audit::FindingLevel::kWarn:
      return "\033[33m";
    case audit::FindingLevel::kError:
      return "\033[31m";
  }
  return "";
}

const char* status_color(const audit::AuditStatus status) {
  switch (status) {
    case audit::AuditStatus::kReady:
      return "\033[32m";
    case audit::AuditStatus::kDegraded:
      return "\033[33m";
    case audit::AuditStatus::kNeedsFixes:
      return "\033[31m";
  }
  return "";
}

constexpr const char* kReset = "\033[0m";

}  // namespace

std::string format_finding_line(const audit::Finding& finding, const bool color) {
  std::string tag(audit::to_string(finding.level));
  tag.resize(5, ' ');
  tag = "[" + tag + "]";
  if (color) {
    tag = level_color(finding.level) + tag + kReset;
  }
  return tag + " " + finding.resource_id + ": " + finding.message;
}

int exit_code_for(const audit::AuditStatus status) {
  return status == audit::AuditStatus::kNeedsFixes ? 1 : 0;
}

int execute_audit(const app::AuditRequest& req, app::AuditServices& services,
                  core::IClock& clock, const bool color, std::ostream& out, std::ostream& err) {
  // ── Startup diagnostic block ──────────────────────────────────────────────
  err << "pipeaudit v" << core::kBuildVersion << "\n";
  err << "Root:        " << req.root << "\n";
  err << "Budgets:     ingest " << checks::format_minutes(req.registry.ingest_budget_minutes)
      << "m, logs " << checks::format_minutes(req.registry.log_budget_minutes)
      << "m, analytics " << checks::format_minutes(req.registry.analytics_budget_minutes)
      << "m\n";
  err << "Jobs:        " << req.jobs << "\n";
  if (req.engine.smoke_test) {
    err << "Smoke run:   enabled (" << req.engine.python << ", timeout "
        << req.engine.smoke_timeout.count() << "s)\n";
  } else {
    err << "Smoke run:   disabled\n";
  }
  err << "History:     " << (services.history != nullptr ? "SQLite" : "not recorded") << "\n";

  auto sink = [&out, color](const audit::Finding& finding) {
    out << format_finding_line(finding, color) << "\n";
  };

  auto result = app::run_audit_pipeline(req, services, clock, sink);
  if (!result.has_value()) {
    err << "Error: report not written: " << result.error() << "\n";
    return kExitReportFailure;
  }

  const auto& response = result.value();
  if (response.history_error.has_value()) {
    err << "Warning: run not recorded in history: " << response.history_error.value() << "\n";
  }

  const auto status = audit::compute_status(response.report.findings);
  out << "Report: " << response.report_path << "\n";
  if (color) {
    out << "STATUS: " << status_color(status) << audit::to_string(status) << kReset << "\n";
  } else {
    out << "STATUS: " << audit::to_string(status) << "\n";
  }
  return exit_code_for(status);
}

}  // namespace pipeaudit::cli
