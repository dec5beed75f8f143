#pragma once

#include "pipeaudit/checks/check_context.h"

#include <optional>
#include <vector>

namespace pipeaudit::checks {

// latest_subdirectory picks the most recently modified directory entry.
// Ties on mtime resolve to the greater name so the choice is deterministic.
[[nodiscard]] std::optional<fs::DirEntry> latest_subdirectory(
    const std::vector<fs::DirEntry>& entries);

// check_directory evaluates a directory resource.
//   Plain directories: present or missing (ERROR when foundational).
//   latest_child directories: the freshest subdirectory is classified against the budget;
//   an absent parent or an empty one is a WARN.
[[nodiscard]] CheckOutcome check_directory(const CheckContext& ctx,
                                           const audit::Resource& resource);

}  // namespace pipeaudit::checks
