#pragma once

#include "pipeaudit/core/result.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeaudit::scheduler {

// Bounded wait for one scheduler listing command.
inline constexpr std::chrono::seconds kQueryTimeout{15};

// ScheduledTask is one scheduler entry as reported by a query implementation.
// Text-based queries cannot provide last_result.
struct ScheduledTask {
  std::string name;
  std::string state;          // "unknown" when not reported
  std::string last_run_time;  // ISO 8601 UTC, or "never" / "unknown"
  std::optional<int> last_result;
  std::vector<std::string> triggers;
};

// IScheduledTaskQuery lists the scheduler tasks whose name contains `pattern`
// (ASCII case-insensitive). An error means the query mechanism itself is unavailable.
class IScheduledTaskQuery {
 public:
  virtual ~IScheduledTaskQuery() = default;

  [[nodiscard]] virtual core::Result<std::vector<ScheduledTask>, std::string> list_tasks(
      const std::string& pattern) = 0;

  // Short identifier recorded in the report ("systemd", "text").
  [[nodiscard]] virtual std::string_view source_name() const = 0;

 protected:
  IScheduledTaskQuery() = default;
  IScheduledTaskQuery(const IScheduledTaskQuery&) = default;
  IScheduledTaskQuery& operator=(const IScheduledTaskQuery&) = default;
  IScheduledTaskQuery(IScheduledTaskQuery&&) = default;
  IScheduledTaskQuery& operator=(IScheduledTaskQuery&&) = default;
};

}  // namespace pipeaudit::scheduler
