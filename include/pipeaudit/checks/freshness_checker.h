#pragma once

#include "pipeaudit/checks/check_context.h"

#include <optional>
#include <string>
#include <string_view>

namespace pipeaudit::checks {

enum class FreshnessState {
  kMissing,
  kFresh,
  kStale,
  kPresent,  // present, no budget declared
};

struct FreshnessResult {
  bool present{false};
  std::optional<double> age_minutes;
  FreshnessState state{FreshnessState::kMissing};
};

// classify_freshness is the pure freshness rule:
//   absent => kMissing; no budget => kPresent; age <= budget => kFresh; else kStale.
// Age is measured on the UTC epoch timeline and clamped at zero.
[[nodiscard]] FreshnessResult classify_freshness(const std::optional<core::Timestamp>& mtime,
                                                 core::Timestamp now,
                                                 const std::optional<double>& budget_minutes);

[[nodiscard]] std::string_view to_string(FreshnessState state) noexcept;

// format_minutes renders a minute count with at most one decimal ("90", "12.5").
[[nodiscard]] std::string format_minutes(double minutes);

// freshness_finding converts a classification into the resource's single freshness finding.
// A missing foundational resource is an ERROR; every other missing resource is a WARN.
[[nodiscard]] audit::Finding freshness_finding(const CheckContext& ctx,
                                               const audit::Resource& resource,
                                               const std::string& path,
                                               const FreshnessResult& result);

// freshness_detail is the JSON summary of a classification for the report.
[[nodiscard]] nlohmann::json freshness_detail(const std::string& path,
                                              const audit::Resource& resource,
                                              const FreshnessResult& result);

// check_freshness evaluates a plain file resource at its locator.
[[nodiscard]] CheckOutcome check_freshness(const CheckContext& ctx,
                                           const audit::Resource& resource);

}  // namespace pipeaudit::checks
