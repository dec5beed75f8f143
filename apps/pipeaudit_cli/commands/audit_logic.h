#pragma once

#include "pipeaudit/app/audit_service.h"
#include "pipeaudit/audit/finding.h"
#include "pipeaudit/audit/status.h"
#include "pipeaudit/core/clock.h"

#include <ostream>
#include <string>

namespace pipeaudit::cli {

inline constexpr int kExitReportFailure = 2;

// format_finding_line renders "[LEVEL] resource_id: message" with the level padded to
// five characters and, when color is set, wrapped in an ANSI color.
[[nodiscard]] std::string format_finding_line(const audit::Finding& finding, bool color);

// Exit code of an audit: 0 for READY or DEGRADED, 1 for NEEDS_FIXES.
[[nodiscard]] int exit_code_for(audit::AuditStatus status);

// execute_audit runs the audit pipeline, streams findings to out and diagnostics to err.
// Takes only interface types; the caller wires concrete adapters.
// Returns the process exit code (kExitReportFailure when the report cannot be written).
int execute_audit(const app::AuditRequest& req, app::AuditServices& services,
                  core::IClock& clock, bool color, std::ostream& out, std::ostream& err);

}  // namespace pipeaudit::cli
