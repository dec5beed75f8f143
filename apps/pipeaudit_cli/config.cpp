#include "config.h"

#include <chrono>

namespace pipeaudit::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_root(AuditCliConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.root = value;
  return true;
}

bool handle_budget(double& target, const std::string& value) {
  const auto minutes = apps::parse_minutes(value);
  if (!minutes.has_value()) {
    return false;
  }
  target = minutes.value();
  return true;
}

bool handle_count(std::size_t& target, const std::string& value) {
  const auto count = apps::parse_count(value);
  if (!count.has_value()) {
    return false;
  }
  target = count.value();
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<AuditCliConfig>> audit_options() {
  return {
      {"--root", true, "Pipeline root directory (default .)", handle_root},
      {"--ingest-budget-minutes", true, "Freshness budget of ingest artifacts (default 90)",
       [](AuditCliConfig& c, const std::string& v) {
         return handle_budget(c.registry.ingest_budget_minutes, v);
       }},
      {"--log-budget-minutes", true, "Freshness budget of append logs (default 180)",
       [](AuditCliConfig& c, const std::string& v) {
         return handle_budget(c.registry.log_budget_minutes, v);
       }},
      {"--analytics-budget-minutes", true,
       "Freshness budget of the latest analytics report (default 1500)",
       [](AuditCliConfig& c, const std::string& v) {
         return handle_budget(c.registry.analytics_budget_minutes, v);
       }},
      {"--tail-lines", true, "Log tail lines kept in the report (0..100, default 3)",
       [](AuditCliConfig& c, const std::string& v) { return handle_count(c.tail_lines, v); }},
      {"--smoke-test", false, "Run one bounded engine cycle",
       [](AuditCliConfig& c, const std::string&) {
         c.smoke_test = true;
         return true;
       }},
      {"--smoke-timeout-seconds", true, "Smoke run timeout (default 120)",
       [](AuditCliConfig& c, const std::string& v) {
         return handle_count(c.smoke_timeout_seconds, v);
       }},
      {"--python", true, "Interpreter for the smoke run (default python3)",
       [](AuditCliConfig& c, const std::string& v) {
         c.python = v;
         return !v.empty();
       }},
      {"--out-dir", true, "Report directory (default <root>/reports/audit)",
       [](AuditCliConfig& c, const std::string& v) {
         c.out_dir = v;
         return !v.empty();
       }},
      {"--jobs", true, "Resources evaluated concurrently (default 1)",
       [](AuditCliConfig& c, const std::string& v) { return handle_count(c.jobs, v); }},
      {"--history-db", true, "Record the run in a SQLite audit history",
       [](AuditCliConfig& c, const std::string& v) {
         c.history_db = v;
         return !v.empty();
       }},
      {"--task-pattern", true, "Scheduler task-name substring (default OPRT)",
       [](AuditCliConfig& c, const std::string& v) {
         c.registry.task_pattern = v;
         return !v.empty();
       }},
      {"--no-color", false, "Disable ANSI colors",
       [](AuditCliConfig& c, const std::string&) {
         c.color = false;
         return true;
       }},
  };
}

apps::ParsedOptions<AuditCliConfig> parse_audit_args(int argc, char* argv[], int start) {
  return apps::parse_options(argc, argv, audit_options(), start);
}

app::AuditRequest to_audit_request(const AuditCliConfig& config) {
  app::AuditRequest req;
  req.root = config.root;
  req.registry = config.registry;
  req.tail_lines = config.tail_lines;
  req.engine.smoke_test = config.smoke_test;
  req.engine.python = config.python;
  req.engine.smoke_timeout =
      std::chrono::seconds{static_cast<std::chrono::seconds::rep>(config.smoke_timeout_seconds)};
  req.jobs = config.jobs;
  req.out_dir = config.out_dir;
  return req;
}

}  // namespace pipeaudit::cli
