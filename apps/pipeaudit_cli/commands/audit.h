#pragma once

// cmd_audit: audit the pipeline rooted at --root and write a timestamped JSON report.
// Usage: pipeaudit_cli [audit] [--root <dir>] [--ingest-budget-minutes <n>]
//                      [--log-budget-minutes <n>] [--analytics-budget-minutes <n>]
//                      [--tail-lines <n>] [--smoke-test] [--smoke-timeout-seconds <n>]
//                      [--python <exe>] [--out-dir <dir>] [--jobs <n>]
//                      [--history-db <path>] [--task-pattern <s>] [--no-color]
// Exit codes: 0 READY or DEGRADED, 1 NEEDS_FIXES or invalid configuration,
//             2 report not written.
int cmd_audit(int argc, char* argv[], int start);  // NOLINT(modernize-avoid-c-arrays)
