#include "history.h"

#include "pipeaudit/storage/sqlite/sqlite_audit_history.h"
#include "pipeaudit/storage/sqlite/sqlite_db.h"

#include "history_logic.h"
#include "shared/arg_parser.h"
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct HistoryCliConfig {
  std::optional<std::string> db_path;
  std::size_t limit{10};
  std::optional<std::string> run_id;
  bool color{true};
};

}  // namespace

int cmd_history(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<pipeaudit::apps::Option<HistoryCliConfig>> options = {
      {"--db", true, "Path to SQLite audit history",
       [](HistoryCliConfig& c, const std::string& v) {
         c.db_path = v;
         return !v.empty();
       }},
      {"--limit", true, "Number of runs listed (default 10)",
       [](HistoryCliConfig& c, const std::string& v) {
         const auto limit = pipeaudit::apps::parse_count(v);
         if (!limit.has_value() || limit.value() == 0) {
           return false;
         }
         c.limit = limit.value();
         return true;
       }},
      {"--run", true, "Run id whose findings are replayed",
       [](HistoryCliConfig& c, const std::string& v) {
         c.run_id = v;
         return !v.empty();
       }},
      {"--no-color", false, "Disable ANSI colors",
       [](HistoryCliConfig& c, const std::string&) {
         c.color = false;
         return true;
       }},
  };
  const auto parsed = pipeaudit::apps::parse_options(argc, argv, options, 2);
  for (const auto& error : parsed.errors) {
    std::cerr << error << "\n";
  }
  if (!parsed.ok()) {
    return 1;
  }

  const auto& config = parsed.config;
  if (!config.db_path.has_value()) {
    std::cerr << "Error: --db <path> is required\n";
    return 1;
  }

  auto db_result = pipeaudit::storage::sqlite::SqliteDb::open(config.db_path.value());
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

  pipeaudit::storage::sqlite::SqliteAuditHistory history(db);
  if (config.run_id.has_value()) {
    return pipeaudit::cli::execute_show_run(history, config.run_id.value(), config.color,
                                            std::cout, std::cerr);
  }
  return pipeaudit::cli::execute_list_runs(history, config.limit, std::cout);
}
