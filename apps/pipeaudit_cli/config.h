#pragma once

#include "pipeaudit/app/audit_service.h"
#include "pipeaudit/registry/resource_registry.h"

#include "shared/arg_parser.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pipeaudit::cli {

inline constexpr std::size_t kMaxTailLines = 100;
inline constexpr std::size_t kMaxJobs = 64;

// AuditCliConfig holds the parsed flags of the audit subcommand.
// Every field has an explicit default; optional fields mean "not configured".
struct AuditCliConfig {
  std::string root{"."};                    // NOLINT(readability-identifier-naming)
  registry::RegistryOptions registry;       // NOLINT(readability-identifier-naming)
  std::size_t tail_lines{3};                // NOLINT(readability-identifier-naming)
  bool smoke_test{false};                   // NOLINT(readability-identifier-naming)
  std::size_t smoke_timeout_seconds{120};   // NOLINT(readability-identifier-naming)
  std::string python{"python3"};            // NOLINT(readability-identifier-naming)
  std::optional<std::string> out_dir;       // NOLINT(readability-identifier-naming)
  std::size_t jobs{1};                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> history_db;    // NOLINT(readability-identifier-naming)
  bool color{true};                         // NOLINT(readability-identifier-naming)
};

// audit_options is the flag registry of the audit subcommand.
[[nodiscard]] std::vector<apps::Option<AuditCliConfig>> audit_options();

// parse_audit_args parses argv[start..] into an AuditCliConfig.
[[nodiscard]] apps::ParsedOptions<AuditCliConfig> parse_audit_args(
    int argc, char* argv[], int start);  // NOLINT(modernize-avoid-c-arrays)

// to_audit_request maps validated flags onto the service request.
[[nodiscard]] app::AuditRequest to_audit_request(const AuditCliConfig& config);

}  // namespace pipeaudit::cli
