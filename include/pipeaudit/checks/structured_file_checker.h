#pragma once

#include "pipeaudit/checks/check_context.h"

namespace pipeaudit::checks {

// check_structured_file evaluates an ingest artifact: freshness first, then the content
// rules of its DocumentFormat (numeric text, CSV first row, JSON keys and ranges).
// Freshness and content findings are independent; a stale file with bad content yields
// two WARN findings. A missing file yields only the freshness finding.
[[nodiscard]] CheckOutcome check_structured_file(const CheckContext& ctx,
                                                 const audit::Resource& resource);

}  // namespace pipeaudit::checks
