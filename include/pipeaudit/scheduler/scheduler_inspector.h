#pragma once

#include "pipeaudit/checks/check_context.h"
#include "pipeaudit/scheduler/scheduled_task_query.h"

#include <string>
#include <utility>
#include <vector>

namespace pipeaudit::scheduler {

using RoleAssignment = std::vector<std::pair<std::string, std::vector<ScheduledTask>>>;

// partition_by_role assigns every task to the first role whose substrings occur in its
// name (ASCII case-insensitive). Roles keep their declared order; tasks matching no role
// are dropped.
[[nodiscard]] RoleAssignment partition_by_role(const std::vector<ScheduledTask>& tasks,
                                               const std::vector<audit::TaskRole>& roles);

// SchedulerInspector evaluates a scheduler task-group resource.
// The structured query is tried first; when it is unavailable an INFO finding records
// the reason and the text fallback is used. Every matched task is reported OK and each
// empty role is a WARN. The inspector never produces ERROR.
class SchedulerInspector {
 public:
  SchedulerInspector(IScheduledTaskQuery& structured, IScheduledTaskQuery& fallback)
      : structured_(structured), fallback_(fallback) {}

  [[nodiscard]] checks::CheckOutcome inspect(const checks::CheckContext& ctx,
                                             const audit::Resource& resource) const;

 private:
  IScheduledTaskQuery& structured_;
  IScheduledTaskQuery& fallback_;
};

}  // namespace pipeaudit::scheduler
