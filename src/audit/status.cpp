#include "pipeaudit/audit/status.h"

#include <algorithm>

namespace pipeaudit::audit {

AuditStatus compute_status(const std::vector<Finding>& findings) noexcept {
  if (findings.empty()) {
    return AuditStatus::kReady;
  }

  // Most severe level wins; FindingLevel is declared in severity order.
  const auto max_finding =
      std::max_element(findings.begin(), findings.end(),
                       [](const Finding& a, const Finding& b) { return a.level < b.level; });

  switch (max_finding->level) {
    case FindingLevel::kError:
      return AuditStatus::kNeedsFixes;
    case FindingLevel::kWarn:
      return AuditStatus::kDegraded;
    case FindingLevel::kInfo:
    case FindingLevel::kOk:
      return AuditStatus::kReady;
  }

  return AuditStatus::kReady;
}

std::string_view to_string(const AuditStatus status) noexcept {
  switch (status) {
    case AuditStatus::kReady:
      return "READY";
    case AuditStatus::kDegraded:
      return "DEGRADED";
    case AuditStatus::kNeedsFixes:
      return "NEEDS_FIXES";
  }
  return "READY";
}

LevelCounts count_levels(const std::vector<Finding>& findings) noexcept {
  LevelCounts counts{};
  for (const auto& finding : findings) {
    switch (finding.level) {
      case FindingLevel::kOk:
        ++counts.ok;
        break;
      case FindingLevel::kInfo:
        ++counts.info;
        break;
      case FindingLevel::kWarn:
        ++counts.warn;
        break;
      case FindingLevel::kError:
        ++counts.error;
        break;
    }
  }
  return counts;
}

}  // namespace pipeaudit::audit
