#pragma once

#include "pipeaudit/audit/finding.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace pipeaudit::audit {

enum class AuditStatus {
  kReady,
  kDegraded,
  kNeedsFixes,
};

// compute_status reduces a finding set to the overall verdict.
// Precedence: any ERROR => kNeedsFixes, else any WARN => kDegraded, else kReady.
// The result depends only on the multiset of levels, never on finding order.
[[nodiscard]] AuditStatus compute_status(const std::vector<Finding>& findings) noexcept;

[[nodiscard]] std::string_view to_string(AuditStatus status) noexcept;

// Per-level tallies for report stage summaries and run history.
struct LevelCounts {
  std::size_t ok{0};
  std::size_t info{0};
  std::size_t warn{0};
  std::size_t error{0};
};

[[nodiscard]] LevelCounts count_levels(const std::vector<Finding>& findings) noexcept;

}  // namespace pipeaudit::audit
