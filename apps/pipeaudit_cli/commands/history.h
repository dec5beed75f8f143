#pragma once

// cmd_history: list recorded audit runs or replay the findings of one run.
// Usage: pipeaudit_cli history --db <path> [--limit <n>] [--run <run-id>] [--no-color]
int cmd_history(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
