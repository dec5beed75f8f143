#include "pipeaudit/checks/directory_checker.h"

#include "pipeaudit/checks/freshness_checker.h"

namespace pipeaudit::checks {

using audit::FindingKind;
using audit::FindingLevel;

std::optional<fs::DirEntry> latest_subdirectory(const std::vector<fs::DirEntry>& entries) {
  std::optional<fs::DirEntry> latest;
  for (const auto& entry : entries) {
    if (!entry.is_directory) {
      continue;
    }
    if (!latest.has_value() || entry.last_modified > latest->last_modified ||
        (entry.last_modified == latest->last_modified && entry.name > latest->name)) {
      latest = entry;
    }
  }
  return latest;
}

namespace {

CheckOutcome check_latest_child(const CheckContext& ctx, const audit::Resource& resource) {
  CheckOutcome outcome;
  outcome.detail["path"] = resource.locator;

  const std::string path = ctx.resolve(resource.locator);
  if (!ctx.fs.is_directory(path)) {
    outcome.detail["latest"] = nullptr;
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kMissingResource,
                                            "missing: " + resource.locator));
    return outcome;
  }

  const auto latest = latest_subdirectory(ctx.fs.list_directory(path));
  if (!latest.has_value()) {
    outcome.detail["latest"] = nullptr;
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kMissingResource,
                                            "missing: no subdirectory in " + resource.locator));
    return outcome;
  }

  const std::string child = resource.locator + "/" + latest->name;
  const auto result =
      classify_freshness(latest->last_modified, ctx.now, resource.freshness_budget_minutes);

  audit::Finding finding = freshness_finding(ctx, resource, child, result);
  finding.message = latest->name + ": " + finding.message;
  outcome.findings.push_back(std::move(finding));

  outcome.detail = freshness_detail(child, resource, result);
  outcome.detail["latest"] = latest->name;
  return outcome;
}

}  // namespace

CheckOutcome check_directory(const CheckContext& ctx, const audit::Resource& resource) {
  if (resource.latest_child) {
    return check_latest_child(ctx, resource);
  }

  const std::string path = ctx.resolve(resource.locator);
  const auto mtime =
      ctx.fs.is_directory(path) ? ctx.fs.last_modified(path) : std::optional<core::Timestamp>{};
  const auto result = classify_freshness(mtime, ctx.now, resource.freshness_budget_minutes);

  CheckOutcome outcome;
  outcome.findings.push_back(freshness_finding(ctx, resource, resource.locator, result));
  outcome.detail = freshness_detail(resource.locator, resource, result);
  return outcome;
}

}  // namespace pipeaudit::checks
