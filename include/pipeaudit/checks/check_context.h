#pragma once

#include "pipeaudit/audit/finding.h"
#include "pipeaudit/audit/resource.h"
#include "pipeaudit/core/clock.h"
#include "pipeaudit/fs/filesystem.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace pipeaudit::checks {

inline constexpr std::size_t kDefaultTailLines = 3;

// CheckContext is the read-only environment shared by every checker during one run.
// `now` is pinned once at run start so that ages do not drift between resources.
struct CheckContext {
  const fs::IFileSystem& fs;
  core::IClock& clock;
  std::string root;
  core::Timestamp now;
  std::size_t tail_lines{kDefaultTailLines};

  [[nodiscard]] std::string resolve(const std::string& locator) const {
    return fs::join_path(root, locator);
  }
};

// CheckOutcome is what one checker produces for one resource: its findings in emission
// order plus a structured detail object for the report's stage summary.
struct CheckOutcome {
  std::vector<audit::Finding> findings;
  nlohmann::json detail = nlohmann::json::object();
};

// make_finding stamps produced_at from the context clock.
[[nodiscard]] inline audit::Finding make_finding(const CheckContext& ctx,
                                                 const audit::Resource& resource,
                                                 audit::FindingLevel level,
                                                 audit::FindingKind kind, std::string message) {
  return audit::Finding{level, kind, resource.id, std::move(message), ctx.clock.now_iso8601()};
}

}  // namespace pipeaudit::checks
