#include "lease_logic.h"

#include "pipeaudit/checks/freshness_checker.h"
#include "pipeaudit/lease/resource_lease.h"

#include <type_traits>
#include <variant>

namespace pipeaudit::cli {

namespace {

int acquire(const LeaseCommand& cmd, core::IClock& clock, std::ostream& out,
            std::ostream& err) {
  lease::ResourceLease lease(cmd.path, clock);
  auto result = lease.acquire(cmd.max_age_minutes);
  if (!result.has_value()) {
    err << "Error: " << result.error() << "\n";
    return 1;
  }

  return std::visit(
      [&](const auto& outcome) -> int {
        using Outcome = std::decay_t<decltype(outcome)>;
        if constexpr (std::is_same_v<Outcome, lease::LeaseAcquired>) {
          lease.detach();
          out << "acquired: " << cmd.path << "\n"
              << "token: " << lease.token() << "\n";
          return 0;
        } else {
          out << "held: " << cmd.path << " (age " << checks::format_minutes(outcome.age_minutes)
              << "m <= " << checks::format_minutes(cmd.max_age_minutes) << "m)\n";
          return kExitLeaseHeld;
        }
      },
      result.value());
}

int release(const LeaseCommand& cmd, std::ostream& out, std::ostream& err) {
  if (cmd.token.empty()) {
    err << "Error: release needs the token printed by acquire\n";
    return 1;
  }

  auto result = lease::ResourceLease::release_lease_file(cmd.path, cmd.token);
  if (!result.has_value()) {
    err << "Error: " << result.error() << "\n";
    return 1;
  }

  switch (result.value()) {
    case lease::ReleaseOutcome::kReleased:
      out << "released: " << cmd.path << "\n";
      return 0;
    case lease::ReleaseOutcome::kAbsent:
      out << "not held: " << cmd.path << "\n";
      return 0;
    case lease::ReleaseOutcome::kHeldByOther:
      out << "not held: " << cmd.path << " (taken over by another runner)\n";
      return kExitLeaseHeld;
  }
  return 1;
}

}  // namespace

int execute_lease(const LeaseCommand& cmd, core::IClock& clock, std::ostream& out,
                  std::ostream& err) {
  switch (cmd.action) {
    case LeaseAction::kAcquire:
      return acquire(cmd, clock, out, err);
    case LeaseAction::kRelease:
      return release(cmd, out, err);
  }
  return 1;
}

}  // namespace pipeaudit::cli
