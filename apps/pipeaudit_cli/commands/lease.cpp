#include "lease.h"

#include "pipeaudit/core/clock.h"
#include "pipeaudit/lease/resource_lease.h"

#include "lease_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct LeaseCliConfig {
  std::optional<std::string> path;
  double max_age_minutes{pipeaudit::lease::kDefaultStaleAfterMinutes};
  std::string token;
};

}  // namespace

int cmd_lease(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pipeaudit::apps::Option<LeaseCliConfig>> options = {
      {"--path", true, "Lease file path",
       [](LeaseCliConfig& c, const std::string& v) {
         c.path = v;
         return !v.empty();
       }},
      {"--max-age-minutes", true, "Age after which a lease may be replaced (default 55)",
       [](LeaseCliConfig& c, const std::string& v) {
         const auto minutes = pipeaudit::apps::parse_minutes(v);
         if (!minutes.has_value()) {
           return false;
         }
         c.max_age_minutes = minutes.value();
         return true;
       }},
      {"--token", true, "Token printed by acquire (required for release)",
       [](LeaseCliConfig& c, const std::string& v) {
         c.token = v;
         return !v.empty();
       }},
  };
  const char* synopsis = "pipeaudit_cli lease acquire|release --path <file> [--token <t>] [options]";

  if (argc < 3) {
    pipeaudit::apps::print_usage(std::cerr, synopsis, options);
    return 1;
  }

  const std::string verb = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  pipeaudit::cli::LeaseAction action{pipeaudit::cli::LeaseAction::kAcquire};
  if (verb == "acquire") {
    action = pipeaudit::cli::LeaseAction::kAcquire;
  } else if (verb == "release") {
    action = pipeaudit::cli::LeaseAction::kRelease;
  } else {
    std::cerr << "Unknown lease action: " << verb << " (valid: acquire, release)\n";
    return 1;
  }

  const auto parsed = pipeaudit::apps::parse_options(argc, argv, options, 3);
  for (const auto& error : parsed.errors) {
    std::cerr << error << "\n";
  }
  if (!parsed.ok()) {
    return 1;
  }
  if (!parsed.config.path.has_value()) {
    std::cerr << "Error: --path <file> is required\n";
    return 1;
  }

  pipeaudit::cli::LeaseCommand cmd;
  cmd.action = action;
  cmd.path = parsed.config.path.value();
  cmd.max_age_minutes = parsed.config.max_age_minutes;
  cmd.token = parsed.config.token;

  pipeaudit::core::SystemClock clock;
  return pipeaudit::cli::execute_lease(cmd, clock, std::cout, std::cerr);
}
