#pragma once

// cmd_lease: acquire or release a resource lease file.
// Usage: pipeaudit_cli lease acquire --path <file> [--max-age-minutes <n>]
//        pipeaudit_cli lease release --path <file> --token <token>
// Exit codes: 0 acquired/released, 3 held or taken over by another process, 1 error.
int cmd_lease(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
