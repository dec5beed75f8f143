#pragma once

#include "pipeaudit/storage/audit_history.h"

#include <cstddef>
#include <ostream>
#include <string>

namespace pipeaudit::cli {

// execute_list_runs prints one line per recorded run, most recent first.
// execute_show_run replays the findings of one run and its status.
// Both take only interface types; no concrete storage headers are included in this TU.
int execute_list_runs(const storage::IAuditHistory& history, std::size_t limit,
                      std::ostream& out);
int execute_show_run(const storage::IAuditHistory& history, const std::string& run_id,
                     bool color, std::ostream& out, std::ostream& err);

}  // namespace pipeaudit::cli
