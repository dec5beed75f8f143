#include "pipeaudit/audit/resource.h"

namespace pipeaudit::audit {

std::string_view to_string(const ResourceKind kind) noexcept {
  switch (kind) {
    case ResourceKind::kDirectory:
      return "directory";
    case ResourceKind::kFreshFile:
      return "fresh_file";
    case ResourceKind::kStructuredFile:
      return "structured_file";
    case ResourceKind::kPairedArtifact:
      return "paired_artifact";
    case ResourceKind::kAppendLog:
      return "append_log";
    case ResourceKind::kSchedulerTaskGroup:
      return "scheduler_task_group";
  }
  return "fresh_file";
}

std::string_view to_string(const Stage stage) noexcept {
  switch (stage) {
    case Stage::kFolders:
      return "folders";
    case Stage::kIngest:
      return "ingest";
    case Stage::kPairs:
      return "pairs";
    case Stage::kEngine:
      return "engine";
    case Stage::kLogs:
      return "logs";
    case Stage::kAnalytics:
      return "analytics";
    case Stage::kScheduler:
      return "scheduler";
  }
  return "folders";
}

}  // namespace pipeaudit::audit
