#pragma once

#include "pipeaudit/core/clock.h"
#include "pipeaudit/lease/resource_lease.h"

#include <ostream>
#include <string>

namespace pipeaudit::cli {

inline constexpr int kExitLeaseHeld = 3;

enum class LeaseAction {
  kAcquire,  // NOLINT(readability-identifier-naming)
  kRelease,  // NOLINT(readability-identifier-naming)
};

struct LeaseCommand {
  LeaseAction action{LeaseAction::kAcquire};           // NOLINT(readability-identifier-naming)
  std::string path;                                    // NOLINT(readability-identifier-naming)
  double max_age_minutes{lease::kDefaultStaleAfterMinutes};  // NOLINT(readability-identifier-naming)
  std::string token;                                   // NOLINT(readability-identifier-naming)
};

// execute_lease acquires or releases the lease file at cmd.path on behalf of a pipeline
// runner. An acquired lease outlives this process; acquire prints its token on a
// "token: " line and the runner passes it back on release when its cycle ends.
// Release removes the lease only when it still records that token.
// Returns 0 when acquired, released or already absent; kExitLeaseHeld when a fresh
// lease is held by someone else (the caller skips its cycle) or a release names a
// lease that has been taken over; 1 on error.
int execute_lease(const LeaseCommand& cmd, core::IClock& clock, std::ostream& out,
                  std::ostream& err);

}  // namespace pipeaudit::cli
