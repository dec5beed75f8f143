#include "pipeaudit/checks/freshness_checker.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace pipeaudit::checks {

using audit::FindingKind;
using audit::FindingLevel;

FreshnessResult classify_freshness(const std::optional<core::Timestamp>& mtime,
                                   const core::Timestamp now,
                                   const std::optional<double>& budget_minutes) {
  FreshnessResult result;
  if (!mtime.has_value()) {
    result.state = FreshnessState::kMissing;
    return result;
  }

  result.present = true;
  result.age_minutes = core::age_minutes(mtime.value(), now);

  if (!budget_minutes.has_value()) {
    result.state = FreshnessState::kPresent;
  } else if (result.age_minutes.value() <= budget_minutes.value()) {
    result.state = FreshnessState::kFresh;
  } else {
    result.state = FreshnessState::kStale;
  }
  return result;
}

std::string_view to_string(const FreshnessState state) noexcept {
  switch (state) {
    case FreshnessState::kMissing:
      return "missing";
    case FreshnessState::kFresh:
      return "fresh";
    case FreshnessState::kStale:
      return "stale";
    case FreshnessState::kPresent:
      return "present";
  }
  return "missing";
}

std::string format_minutes(const double minutes) {
  const double rounded = core::round_tenth(minutes);
  std::ostringstream oss;
  if (rounded == std::floor(rounded)) {
    oss << std::fixed << std::setprecision(0) << rounded;
  } else {
    oss << std::fixed << std::setprecision(1) << rounded;
  }
  return oss.str();
}

audit::Finding freshness_finding(const CheckContext& ctx, const audit::Resource& resource,
                                 const std::string& path, const FreshnessResult& result) {
  switch (result.state) {
    case FreshnessState::kMissing:
      return make_finding(ctx, resource,
                          resource.foundational ? FindingLevel::kError : FindingLevel::kWarn,
                          FindingKind::kMissingResource, "missing: " + path);
    case FreshnessState::kPresent:
      return make_finding(ctx, resource, FindingLevel::kOk, FindingKind::kNone,
                          "present: " + path);
    case FreshnessState::kFresh:
      return make_finding(ctx, resource, FindingLevel::kOk, FindingKind::kNone,
                          "fresh (age " + format_minutes(result.age_minutes.value()) + "m <= " +
                              format_minutes(resource.freshness_budget_minutes.value()) + "m)");
    case FreshnessState::kStale:
      return make_finding(ctx, resource, FindingLevel::kWarn, FindingKind::kStaleResource,
                          "stale (age " + format_minutes(result.age_minutes.value()) + "m > " +
                              format_minutes(resource.freshness_budget_minutes.value()) + "m)");
  }
  return make_finding(ctx, resource, FindingLevel::kWarn, FindingKind::kMissingResource,
                      "missing: " + path);
}

nlohmann::json freshness_detail(const std::string& path, const audit::Resource& resource,
                                const FreshnessResult& result) {
  nlohmann::json detail;
  detail["path"] = path;
  detail["present"] = result.present;
  detail["state"] = std::string(to_string(result.state));
  detail["age_minutes"] = result.age_minutes.has_value()
                              ? nlohmann::json(core::round_tenth(result.age_minutes.value()))
                              : nlohmann::json(nullptr);
  detail["budget_minutes"] = resource.freshness_budget_minutes.has_value()
                                 ? nlohmann::json(resource.freshness_budget_minutes.value())
                                 : nlohmann::json(nullptr);
  return detail;
}

CheckOutcome check_freshness(const CheckContext& ctx, const audit::Resource& resource) {
  const std::string path = ctx.resolve(resource.locator);
  const auto result =
      classify_freshness(ctx.fs.last_modified(path), ctx.now, resource.freshness_budget_minutes);

  CheckOutcome outcome;
  outcome.findings.push_back(freshness_finding(ctx, resource, resource.locator, result));
  outcome.detail = freshness_detail(resource.locator, resource, result);
  return outcome;
}

}  // namespace pipeaudit::checks
