#include "audit.h"

#include "pipeaudit/app/audit_service.h"
#include "pipeaudit/core/clock.h"
#include "pipeaudit/fs/local_filesystem.h"
#include "pipeaudit/process/subprocess_runner.h"
#include "pipeaudit/scheduler/systemd_task_query.h"
#include "pipeaudit/scheduler/text_listing_task_query.h"
#include "pipeaudit/storage/sqlite/sqlite_audit_history.h"
#include "pipeaudit/storage/sqlite/sqlite_db.h"

#include "audit_logic.h"
#include "config.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <string>

int cmd_audit(int argc, char* argv[], int start) {  // NOLINT(modernize-avoid-c-arrays)
  for (int i = start; i < argc; ++i) {
    if (std::string(argv[i]) == "--help") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      pipeaudit::apps::print_usage(std::cout, "pipeaudit_cli audit [options]",
                                   pipeaudit::cli::audit_options());
      return 0;
    }
  }

  const auto parsed = pipeaudit::cli::parse_audit_args(argc, argv, start);
  for (const auto& error : parsed.errors) {
    std::cerr << error << "\n";
  }
  if (!parsed.ok()) {
    pipeaudit::apps::print_usage(std::cerr, "pipeaudit_cli audit [options]",
                                 pipeaudit::cli::audit_options());
    return 1;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const auto& config = parsed.config;
  const std::string config_error = pipeaudit::cli::validate_audit_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  pipeaudit::fs::LocalFileSystem filesystem;
  pipeaudit::process::PosixSubprocessRunner runner;
  pipeaudit::scheduler::SystemdTaskQuery structured_tasks(runner);
  pipeaudit::scheduler::TextListingTaskQuery fallback_tasks(runner);
  pipeaudit::core::SystemClock clock;

  std::unique_ptr<pipeaudit::storage::sqlite::SqliteAuditHistory> history;
  if (config.history_db.has_value()) {
    auto db_result = pipeaudit::storage::sqlite::SqliteDb::open(config.history_db.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }
    history = std::make_unique<pipeaudit::storage::sqlite::SqliteAuditHistory>(db);
  }

  pipeaudit::app::AuditServices services{filesystem, structured_tasks, fallback_tasks, &runner,
                                         history.get()};

  return pipeaudit::cli::execute_audit(pipeaudit::cli::to_audit_request(config), services, clock,
                                       config.color, std::cout, std::cerr);
}
