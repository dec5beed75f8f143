#pragma once

#include "pipeaudit/audit/audit_report.h"
#include "pipeaudit/checks/check_context.h"
#include "pipeaudit/checks/engine_checker.h"
#include "pipeaudit/core/clock.h"
#include "pipeaudit/core/result.h"
#include "pipeaudit/fs/filesystem.h"
#include "pipeaudit/process/subprocess_runner.h"
#include "pipeaudit/registry/resource_registry.h"
#include "pipeaudit/scheduler/scheduled_task_query.h"
#include "pipeaudit/storage/audit_history.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace pipeaudit::app {

// AuditServices is the composition root of one audit run.
// It holds references (not ownership) to the environment adapters; the CLI or a test
// creates the concrete instances and manages their lifetimes.
// runner may be null when the smoke run is disabled; history may be null when runs
// are not recorded.
struct AuditServices {
  const fs::IFileSystem& fs;                        // NOLINT(readability-identifier-naming)
  scheduler::IScheduledTaskQuery& structured_tasks;  // NOLINT(readability-identifier-naming)
  scheduler::IScheduledTaskQuery& fallback_tasks;    // NOLINT(readability-identifier-naming)
  process::ISubprocessRunner* runner;               // NOLINT(readability-identifier-naming)
  storage::IAuditHistory* history;                  // NOLINT(readability-identifier-naming)

  AuditServices(const fs::IFileSystem& fs, scheduler::IScheduledTaskQuery& structured_tasks,
                scheduler::IScheduledTaskQuery& fallback_tasks,
                process::ISubprocessRunner* runner = nullptr,
                storage::IAuditHistory* history = nullptr)
      : fs(fs),
        structured_tasks(structured_tasks),
        fallback_tasks(fallback_tasks),
        runner(runner),
        history(history) {}

  ~AuditServices() = default;

  AuditServices(const AuditServices&) = delete;
  AuditServices& operator=(const AuditServices&) = delete;
  AuditServices(AuditServices&&) = delete;
  AuditServices& operator=(AuditServices&&) = delete;
};

// ────────────────────────────────────────────────────────────────
// Audit Run
// ────────────────────────────────────────────────────────────────

struct AuditRequest {
  std::string root{"."};                          // NOLINT(readability-identifier-naming)
  registry::RegistryOptions registry;             // NOLINT(readability-identifier-naming)
  std::size_t tail_lines{checks::kDefaultTailLines};  // NOLINT(readability-identifier-naming)
  checks::EngineCheckOptions engine;              // NOLINT(readability-identifier-naming)
  std::size_t jobs{1};                            // NOLINT(readability-identifier-naming)

  // Report directory; <root>/reports/audit when not set.
  std::optional<std::string> out_dir;  // NOLINT(readability-identifier-naming)
};

// FindingSink receives every finding as soon as its resource has been evaluated.
// Calls happen on the calling thread, in registry order.
using FindingSink = std::function<void(const audit::Finding&)>;

[[nodiscard]] std::string default_out_dir(const std::string& root);

// run_id_for renders "audit-<YYYYMMDD_HHMMSS>Z" for the run start.
[[nodiscard]] std::string run_id_for(core::Timestamp started_at);

// evaluate_resource dispatches one resource to the checker of its kind.
[[nodiscard]] checks::CheckOutcome evaluate_resource(const checks::CheckContext& ctx,
                                                     const audit::Resource& resource,
                                                     const AuditRequest& req,
                                                     AuditServices& services);

// run_audit evaluates every registered resource and assembles the report.
// With req.jobs > 1 up to that many resources are evaluated concurrently; results are
// merged in registry order so the report does not depend on scheduling.
// Does not touch the report directory or the history.
[[nodiscard]] audit::AuditReport run_audit(const AuditRequest& req, AuditServices& services,
                                           core::IClock& clock, const FindingSink& sink = {});

// ────────────────────────────────────────────────────────────────
// Audit Pipeline (run + persist)
// ────────────────────────────────────────────────────────────────

struct AuditPipelineResponse {
  audit::AuditReport report;  // NOLINT(readability-identifier-naming)
  std::string report_path;    // NOLINT(readability-identifier-naming)

  // Set when the run could not be recorded in the history. Not fatal: the report
  // file is the record of the run.
  std::optional<std::string> history_error;  // NOLINT(readability-identifier-naming)
};

// run_audit_pipeline runs the audit, writes the report and records the run in the
// history when one is configured. Fails only when the report cannot be written.
[[nodiscard]] core::Result<AuditPipelineResponse, std::string> run_audit_pipeline(
    const AuditRequest& req, AuditServices& services, core::IClock& clock,
    const FindingSink& sink = {});

}  // namespace pipeaudit::app
