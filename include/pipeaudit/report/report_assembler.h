#pragma once

#include "pipeaudit/audit/audit_report.h"
#include "pipeaudit/core/result.h"
#include "pipeaudit/core/time.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pipeaudit::report {

[[nodiscard]] nlohmann::json finding_to_json(const audit::Finding& finding);

// report_to_json serializes the report document:
//   format, version, run_id, started_at, completed_at, root, status,
//   counts {OK, INFO, WARN, ERROR}, findings [ordered], stages {stage_detail}.
// status is recomputed from the findings, never read from a stored field.
[[nodiscard]] nlohmann::json report_to_json(const audit::AuditReport& report);

// render_report dumps report_to_json with the given indent (-1 for one line).
// Bytes copied from pipeline files that are not valid UTF-8 are replaced with U+FFFD,
// so rendering never fails on file content.
[[nodiscard]] std::string render_report(const audit::AuditReport& report, int indent = 2);

// report_file_name renders "audit_<YYYYMMDD_HHMMSS>Z.json" for the run start.
[[nodiscard]] std::string report_file_name(core::Timestamp started_at);

// write_report persists the report under out_dir (created if absent) and returns the
// path written. An existing file is never overwritten: "_1", "_2", ... suffixes are
// tried in turn, and the suffix used is appended to report.run_id as well so the run id
// names its file. Any failure is returned as an error with report.run_id unchanged; no
// partial report is left behind.
[[nodiscard]] core::Result<std::string, std::string> write_report(
    audit::AuditReport& report, const std::string& out_dir, core::Timestamp started_at);

}  // namespace pipeaudit::report
