#pragma once

#include "pipeaudit/checks/check_context.h"
#include "pipeaudit/process/subprocess_runner.h"

#include <chrono>
#include <string>
#include <vector>

namespace pipeaudit::checks {

inline constexpr std::size_t kSmokeOutputTailChars = 600;

struct EngineCheckOptions {
  bool smoke_test{false};
  std::string python{"python3"};
  std::chrono::seconds smoke_timeout{120};
  std::string heartbeat_locator{"logs/engine_heartbeat.txt"};
};

// smoke_arguments returns the engine arguments for one smoke cycle, every path anchored
// at the pipeline root.
[[nodiscard]] std::vector<std::string> smoke_arguments(const CheckContext& ctx,
                                                       const audit::Resource& resource,
                                                       const EngineCheckOptions& options);

// check_engine reports engine presence, the last heartbeat line (INFO) and, when
// enabled, the outcome of a bounded smoke run. A smoke run that cannot start, exits
// nonzero or times out is a WARN.
[[nodiscard]] CheckOutcome check_engine(const CheckContext& ctx, const audit::Resource& resource,
                                        const EngineCheckOptions& options,
                                        process::ISubprocessRunner* runner);

}  // namespace pipeaudit::checks
