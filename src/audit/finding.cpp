#include "pipeaudit/audit/finding.h"

namespace pipeaudit::audit {

std::string_view to_string(const FindingLevel level) noexcept {
  switch (level) {
    case FindingLevel::kOk:
      return "OK";
    case FindingLevel::kInfo:
      return "INFO";
    case FindingLevel::kWarn:
      return "WARN";
    case FindingLevel::kError:
      return "ERROR";
  }
  return "OK";
}

std::string_view to_string(const FindingKind kind) noexcept {
  switch (kind) {
    case FindingKind::kNone:
      return "none";
    case FindingKind::kMissingResource:
      return "missing_resource";
    case FindingKind::kStaleResource:
      return "stale_resource";
    case FindingKind::kInvalidSchema:
      return "invalid_schema";
    case FindingKind::kOutOfRangeValue:
      return "out_of_range_value";
    case FindingKind::kParseFailure:
      return "parse_failure";
    case FindingKind::kSubprocessFailure:
      return "subprocess_failure";
    case FindingKind::kSchedulerQueryFailure:
      return "scheduler_query_failure";
  }
  return "none";
}

std::optional<FindingLevel> finding_level_from_string(const std::string_view name) {
  for (const auto level :
       {FindingLevel::kOk, FindingLevel::kInfo, FindingLevel::kWarn, FindingLevel::kError}) {
    if (to_string(level) == name) {
      return level;
    }
  }
  return std::nullopt;
}

std::optional<FindingKind> finding_kind_from_string(const std::string_view name) {
  for (const auto kind : {FindingKind::kNone, FindingKind::kMissingResource,
                          FindingKind::kStaleResource, FindingKind::kInvalidSchema,
                          FindingKind::kOutOfRangeValue, FindingKind::kParseFailure,
                          FindingKind::kSubprocessFailure, FindingKind::kSchedulerQueryFailure}) {
    if (to_string(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

}  // namespace pipeaudit::audit
