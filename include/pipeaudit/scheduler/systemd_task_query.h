#pragma once

#include "pipeaudit/process/subprocess_runner.h"
#include "pipeaudit/scheduler/scheduled_task_query.h"

#include <map>

namespace pipeaudit::scheduler {

// SystemdTaskQuery is the structured scheduler query. It reads
//   systemctl list-timers --all --output=json --no-pager
// and, for every matching timer, the activated unit's state and last exit status via
//   systemctl show <unit> --property=ActiveState,ExecMainStatus,ExecMainExitTimestamp
class SystemdTaskQuery final : public IScheduledTaskQuery {
 public:
  explicit SystemdTaskQuery(process::ISubprocessRunner& runner) : runner_(runner) {}

  [[nodiscard]] core::Result<std::vector<ScheduledTask>, std::string> list_tasks(
      const std::string& pattern) override;

  [[nodiscard]] std::string_view source_name() const override { return "systemd"; }

 private:
  process::ISubprocessRunner& runner_;
};

// parse_timer_listing turns the JSON listing into tasks filtered by pattern.
// Unit details are left empty; they are filled from `systemctl show`.
[[nodiscard]] core::Result<std::vector<ScheduledTask>, std::string> parse_timer_listing(
    const std::string& json_text, const std::string& pattern);

// parse_unit_properties reads "Key=Value" lines.
[[nodiscard]] std::map<std::string, std::string> parse_unit_properties(const std::string& text);

}  // namespace pipeaudit::scheduler
