#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace pipeaudit::audit {

// Ordered by severity: kOk < kInfo < kWarn < kError.
enum class FindingLevel {
  kOk,
  kInfo,
  kWarn,
  kError,
};

// Failure taxonomy. Every failure mode is recovered into exactly one Finding.
// kNone marks observations that are not failures (OK and INFO findings).
enum class FindingKind {
  kNone,
  kMissingResource,
  kStaleResource,
  kInvalidSchema,
  kOutOfRangeValue,
  kParseFailure,
  kSubprocessFailure,
  kSchedulerQueryFailure,
};

struct Finding {
  FindingLevel level{FindingLevel::kOk};
  FindingKind kind{FindingKind::kNone};
  std::string resource_id;
  std::string message;
  std::string produced_at;  // UTC ISO 8601

  bool operator==(const Finding&) const = default;
};

[[nodiscard]] std::string_view to_string(FindingLevel level) noexcept;
[[nodiscard]] std::string_view to_string(FindingKind kind) noexcept;

// Inverse of to_string; std::nullopt for unknown names.
[[nodiscard]] std::optional<FindingLevel> finding_level_from_string(std::string_view name);
[[nodiscard]] std::optional<FindingKind> finding_kind_from_string(std::string_view name);

}  // namespace pipeaudit::audit
