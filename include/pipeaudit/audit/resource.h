#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeaudit::audit {

enum class ResourceKind {
  kDirectory,
  kFreshFile,
  kStructuredFile,
  kPairedArtifact,
  kAppendLog,
  kSchedulerTaskGroup,
};

// Stages in report order. The registry emits resources grouped by stage in this order.
enum class Stage {
  kFolders,
  kIngest,
  kPairs,
  kEngine,
  kLogs,
  kAnalytics,
  kScheduler,
};

// How the content of a file resource is interpreted.
enum class DocumentFormat {
  kNone,         // presence/freshness only
  kNumericText,  // single free-text numeric value
  kCsv,          // tabular, first row inspected
  kJson,         // one JSON object
  kJsonLines,    // append-only line-delimited JSON
};

// Closed interval [min, max] on a numeric field addressed by a dotted key path.
struct NumericRange {
  std::string key;
  double min{0.0};
  double max{0.0};
};

// Compound schema evaluated against the primary document of a paired artifact.
struct PairSchema {
  std::string primary_suffix{"_A.json"};
  std::string secondary_suffix{"_B.json"};
  std::string vector_key{"phase_vector"};
  std::size_t vector_length{5};
  std::string alignment_block{"tf_alignment"};
  std::vector<std::string> alignment_fields;
  std::string indicator_block{"indicators"};
  std::vector<std::string> indicator_fields;
};

// A scheduler role category: a task belongs to the role when its name contains
// any of the substrings (ASCII case-insensitive).
struct TaskRole {
  std::string name;
  std::vector<std::string> substrings;
};

// Resource is one declared pipeline dependency. Built once by the registry and
// never modified afterwards.
//
// locator is relative to the pipeline root, except for kSchedulerTaskGroup where it is
// the project-identifying task-name substring and for kPairedArtifact where it is the
// path prefix shared by the two files (e.g. "agents/BTC").
struct Resource {
  std::string id;
  ResourceKind kind{ResourceKind::kFreshFile};
  Stage stage{Stage::kFolders};
  std::string locator;
  std::optional<double> freshness_budget_minutes;
  DocumentFormat format{DocumentFormat::kNone};
  std::vector<std::string> required_keys;
  std::optional<NumericRange> numeric_range;
  std::size_t min_columns{0};
  bool foundational{false};
  bool latest_child{false};
  std::optional<PairSchema> pair_schema;
  std::vector<TaskRole> task_roles;
};

[[nodiscard]] std::string_view to_string(ResourceKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

}  // namespace pipeaudit::audit
