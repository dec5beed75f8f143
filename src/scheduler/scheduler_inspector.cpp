#include "pipeaudit/scheduler/scheduler_inspector.h"

#include "pipeaudit/core/text.h"

namespace pipeaudit::scheduler {

using audit::FindingKind;
using audit::FindingLevel;

RoleAssignment partition_by_role(const std::vector<ScheduledTask>& tasks,
                                 const std::vector<audit::TaskRole>& roles) {
  RoleAssignment assignment;
  assignment.reserve(roles.size());
  for (const auto& role : roles) {
    assignment.emplace_back(role.name, std::vector<ScheduledTask>{});
  }

  for (const auto& task : tasks) {
    for (std::size_t i = 0; i < roles.size(); ++i) {
      bool matched = false;
      for (const auto& needle : roles[i].substrings) {
        if (core::contains_ascii_ci(task.name, needle)) {
          matched = true;
          break;
        }
      }
      if (matched) {
        assignment[i].second.push_back(task);
        break;
      }
    }
  }
  return assignment;
}

namespace {

nlohmann::json task_to_json(const ScheduledTask& task) {
  return nlohmann::json{
      {"name", task.name},
      {"state", task.state},
      {"last_run_time", task.last_run_time},
      {"last_result", task.last_result.has_value() ? nlohmann::json(task.last_result.value())
                                                   : nlohmann::json(nullptr)},
      {"triggers", task.triggers},
  };
}

std::string describe(const std::string& role, const ScheduledTask& task) {
  const std::string result =
      task.last_result.has_value() ? std::to_string(task.last_result.value()) : "n/a";
  return role + ": " + task.name + " (last run " + task.last_run_time + ", last result " +
         result + ", state " + task.state + ")";
}

}  // namespace

checks::CheckOutcome SchedulerInspector::inspect(const checks::CheckContext& ctx,
                                                 const audit::Resource& resource) const {
  checks::CheckOutcome outcome;
  const std::string& pattern = resource.locator;
  outcome.detail["pattern"] = pattern;

  std::vector<ScheduledTask> tasks;
  auto structured = structured_.list_tasks(pattern);
  if (structured.has_value()) {
    outcome.detail["source"] = std::string(structured_.source_name());
    tasks = std::move(structured.value());
  } else {
    outcome.findings.push_back(checks::make_finding(
        ctx, resource, FindingLevel::kInfo, FindingKind::kSchedulerQueryFailure,
        std::string(structured_.source_name()) + " query unavailable (" + structured.error() +
            "), using " + std::string(fallback_.source_name()) + " listing"));

    auto fallback = fallback_.list_tasks(pattern);
    if (fallback.has_value()) {
      outcome.detail["source"] = std::string(fallback_.source_name());
      tasks = std::move(fallback.value());
    } else {
      outcome.detail["source"] = nullptr;
      outcome.findings.push_back(checks::make_finding(
          ctx, resource, FindingLevel::kInfo, FindingKind::kSchedulerQueryFailure,
          std::string(fallback_.source_name()) + " listing unavailable (" + fallback.error() +
              ")"));
    }
  }

  nlohmann::json roles = nlohmann::json::object();
  for (const auto& [role, members] : partition_by_role(tasks, resource.task_roles)) {
    roles[role] = nlohmann::json::array();
    if (members.empty()) {
      outcome.findings.push_back(checks::make_finding(
          ctx, resource, FindingLevel::kWarn, FindingKind::kMissingResource,
          "no " + role + " task matching '" + pattern + "'"));
      continue;
    }
    for (const auto& task : members) {
      roles[role].push_back(task_to_json(task));
      outcome.findings.push_back(checks::make_finding(ctx, resource, FindingLevel::kOk,
                                                      FindingKind::kNone, describe(role, task)));
    }
  }
  outcome.detail["roles"] = roles;
  return outcome;
}

}  // namespace pipeaudit::scheduler
