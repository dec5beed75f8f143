#pragma once

#include "pipeaudit/process/subprocess_runner.h"
#include "pipeaudit/scheduler/scheduled_task_query.h"

namespace pipeaudit::scheduler {

// TextListingTaskQuery is the lower-fidelity fallback. It scans the plain-text output of
//   systemctl list-timers --all --no-pager --no-legend
//   crontab -l
// for lines containing the pattern. No structured result code is available.
// Fails only when neither listing could be produced.
class TextListingTaskQuery final : public IScheduledTaskQuery {
 public:
  explicit TextListingTaskQuery(process::ISubprocessRunner& runner) : runner_(runner) {}

  [[nodiscard]] core::Result<std::vector<ScheduledTask>, std::string> list_tasks(
      const std::string& pattern) override;

  [[nodiscard]] std::string_view source_name() const override { return "text"; }

 private:
  process::ISubprocessRunner& runner_;
};

// scan_timer_text extracts tasks from the legend-less list-timers table.
[[nodiscard]] std::vector<ScheduledTask> scan_timer_text(const std::string& text,
                                                         const std::string& pattern);

// scan_crontab_text extracts tasks from crontab lines (comments and env lines skipped).
[[nodiscard]] std::vector<ScheduledTask> scan_crontab_text(const std::string& text,
                                                           const std::string& pattern);

}  // namespace pipeaudit::scheduler
