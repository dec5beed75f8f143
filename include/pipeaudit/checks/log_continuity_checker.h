#pragma once

#include "pipeaudit/checks/check_context.h"

#include <string>
#include <vector>

namespace pipeaudit::checks {

// Fields of the latest decision record surfaced for human inspection, in display order.
[[nodiscard]] const std::vector<std::string>& latest_record_fields();

// summarize_record renders "signal=LONG C_eff=0.71 ..." for the selected fields.
// Absent fields render as "-".
[[nodiscard]] std::string summarize_record(const nlohmann::json& record);

// check_append_log evaluates one append-only log: freshness, then
//   tabular logs: every required column present in the first row (order irrelevant),
//   line-delimited JSON logs: the final non-blank line parses as an object.
// A failed latest-record parse is a WARN; producers append concurrently and partial
// final lines are expected. The trailing tail_lines lines are kept in the detail.
[[nodiscard]] CheckOutcome check_append_log(const CheckContext& ctx,
                                            const audit::Resource& resource);

}  // namespace pipeaudit::checks
