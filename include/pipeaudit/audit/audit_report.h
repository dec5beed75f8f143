#pragma once

#include "pipeaudit/audit/finding.h"
#include "pipeaudit/audit/status.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pipeaudit::audit {

// AuditReport is the terminal output of one run. It is assembled once, after every
// checker has completed, and is not modified after it has been persisted.
//
// stage_detail maps a stage name ("folders", "ingest", ...) to a structured summary:
//   { "counts": {"OK": n, "INFO": n, "WARN": n, "ERROR": n},
//     "resources": { <resource_id>: <checker detail object> } }
struct AuditReport {
  std::string run_id;
  std::string started_at;
  std::string completed_at;
  std::string root;
  std::vector<Finding> findings;
  nlohmann::json stage_detail = nlohmann::json::object();
  AuditStatus status{AuditStatus::kReady};
};

}  // namespace pipeaudit::audit
