#include "startup_guard.h"

namespace pipeaudit::cli {

std::string validate_audit_config(const AuditCliConfig& config) {
  if (config.root.empty()) {
    return "Error: --root <dir> must not be empty";
  }

  const auto& reg = config.registry;
  if (!(reg.ingest_budget_minutes > 0.0) || !(reg.log_budget_minutes > 0.0) ||
      !(reg.analytics_budget_minutes > 0.0)) {
    return "Error: freshness budgets must be positive numbers of minutes";
  }

  if (config.tail_lines > kMaxTailLines) {
    return "Error: --tail-lines must be between 0 and " + std::to_string(kMaxTailLines);
  }

  if (config.jobs == 0 || config.jobs > kMaxJobs) {
    return "Error: --jobs must be between 1 and " + std::to_string(kMaxJobs);
  }

  if (reg.task_pattern.empty()) {
    return "Error: --task-pattern must not be empty";
  }

  if (config.smoke_test) {
    if (config.python.empty()) {
      return "Error: --python <exe> is required with --smoke-test";
    }
    if (config.smoke_timeout_seconds == 0) {
      return "Error: --smoke-timeout-seconds must be at least 1";
    }
  }

  if (config.out_dir.has_value() && config.out_dir->empty()) {
    return "Error: --out-dir must not be empty";
  }
  if (config.history_db.has_value() && config.history_db->empty()) {
    return "Error: --history-db must not be empty";
  }

  return "";
}

}  // namespace pipeaudit::cli
