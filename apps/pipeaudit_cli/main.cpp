#include "pipeaudit/core/version.h"

#include "commands/audit.h"
#include "commands/history.h"
#include "commands/lease.h"
#include <iostream>
#include <string>

namespace {

void print_help() {
  std::cout << "pipeaudit v" << pipeaudit::core::kBuildVersion << "\n"
            << "Usage: pipeaudit_cli <command> [options]\n"
            << "  audit     Audit the pipeline and write a report (default command)\n"
            << "  lease     Acquire or release a resource lease\n"
            << "  history   List recorded runs or replay one run\n"
            << "Run 'pipeaudit_cli audit --help' for the audit options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  // Check for subcommands; anything else is treated as audit flags.
  if (argc > 1) {
    const std::string subcommand = argv[1];
    if (subcommand == "audit") {
      return cmd_audit(argc, argv, 2);
    }
    if (subcommand == "lease") {
      return cmd_lease(argc, argv);
    }
    if (subcommand == "history") {
      return cmd_history(argc, argv);
    }
    if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
      print_help();
      return 0;
    }
    if (subcommand == "--version") {
      std::cout << pipeaudit::core::kBuildVersion << "\n";
      return 0;
    }
  }

  return cmd_audit(argc, argv, 1);
}
