#pragma once

#include "config.h"
#include <string>

namespace pipeaudit::cli {

// validate_audit_config checks startup preconditions for an audit run.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - root is not empty
// - every freshness budget is a positive number of minutes
// - tail_lines <= kMaxTailLines
// - 1 <= jobs <= kMaxJobs
// - task_pattern is not empty
// - with --smoke-test: python is set and the timeout is at least one second
// - out_dir and history_db, when given, are not empty
[[nodiscard]] std::string validate_audit_config(const AuditCliConfig& config);

}  // namespace pipeaudit::cli
