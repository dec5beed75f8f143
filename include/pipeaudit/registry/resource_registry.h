#pragma once

#include "pipeaudit/audit/resource.h"

#include <string>
#include <vector>

namespace pipeaudit::registry {

inline constexpr double kDefaultIngestBudgetMinutes = 90.0;
inline constexpr double kDefaultLogBudgetMinutes = 180.0;
inline constexpr double kDefaultAnalyticsBudgetMinutes = 1500.0;
inline constexpr const char* kDefaultTaskPattern = "OPRT";

// RegistryOptions carries the tunables that shape resource descriptors.
struct RegistryOptions {
  double ingest_budget_minutes{kDefaultIngestBudgetMinutes};
  double log_budget_minutes{kDefaultLogBudgetMinutes};
  double analytics_budget_minutes{kDefaultAnalyticsBudgetMinutes};
  std::string task_pattern{kDefaultTaskPattern};
};

// Tracked instruments, one paired artifact each.
[[nodiscard]] const std::vector<std::string>& tracked_instruments();

// Canonical header of the tabular run log, sorted.
[[nodiscard]] const std::vector<std::string>& run_log_columns();

// build_default_registry declares every resource of the pipeline in report order:
// folders, ingest, pairs, engine, logs, analytics, scheduler.
// Construction never fails; paths that do not resolve are reported by the checkers.
[[nodiscard]] std::vector<audit::Resource> build_default_registry(const RegistryOptions& options);

}  // namespace pipeaudit::registry
