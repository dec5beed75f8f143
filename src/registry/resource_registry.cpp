#include "pipeaudit/registry/resource_registry.h"

namespace pipeaudit::registry {

using audit::DocumentFormat;
using audit::Resource;
using audit::ResourceKind;
using audit::Stage;

const std::vector<std::string>& tracked_instruments() {
  static const std::vector<std::string> kInstruments = {"BTC", "ETH",  "SOL",  "SPX",
                                                        "NDX", "DXY", "GOLD", "US10Y"};
  return kInstruments;
}

const std::vector<std::string>& run_log_columns() {
  static const std::vector<std::string> kColumns = {
      "C_eff",     "asset",         "phase_angle_deg", "price",       "signal",
      "size_band", "timestamp_utc", "trap_T",          "volume_ratio"};
  return kColumns;
}

namespace {

// ── folders ───────────────────────────────────────────────────────────────
void add_folders(std::vector<Resource>& out) {
  for (const char* name : {"agents", "data", "logs", "reports", "scripts"}) {
    Resource r;
    r.id = std::string("dir:") + name;
    r.kind = ResourceKind::kDirectory;
    r.stage = Stage::kFolders;
    r.locator = name;
    r.foundational = true;
    out.push_back(std::move(r));
  }
}

Resource ingest_file(std::string id, std::string locator, DocumentFormat format,
                     double budget) {
  Resource r;
  r.id = std::move(id);
  r.kind = ResourceKind::kStructuredFile;
  r.stage = Stage::kIngest;
  r.locator = std::move(locator);
  r.format = format;
  r.freshness_budget_minutes = budget;
  return r;
}

// ── ingest ────────────────────────────────────────────────────────────────
void add_ingest(std::vector<Resource>& out, double budget) {
  out.push_back(ingest_file("ingest:sentiment_index", "data/sentiment_index.txt",
                            DocumentFormat::kNumericText, budget));

  Resource headlines =
      ingest_file("ingest:headlines", "data/headlines.csv", DocumentFormat::kCsv, budget);
  headlines.min_columns = 4;  // iso, title, score, source
  out.push_back(std::move(headlines));

  Resource flows =
      ingest_file("ingest:flows_btc", "data/flows_btc.json", DocumentFormat::kJson, budget);
  flows.required_keys = {"ts_utc", "price", "volume_ratio", "oi", "funding", "liq_skew"};
  out.push_back(std::move(flows));

  Resource pressure =
      ingest_file("ingest:pressure_btc", "data/pressure_btc.json", DocumentFormat::kJson, budget);
  pressure.required_keys = {"pressure", "components", "source"};
  pressure.numeric_range = audit::NumericRange{"pressure", -1.0, 1.0};
  out.push_back(std::move(pressure));
}

// ── pairs ─────────────────────────────────────────────────────────────────
void add_pairs(std::vector<Resource>& out) {
  audit::PairSchema schema;
  schema.alignment_fields = {"H4", "H1"};
  schema.indicator_fields = {"rsi", "macd", "ema"};

  for (const auto& asset : tracked_instruments()) {
    Resource r;
    r.id = "pair:" + asset;
    r.kind = ResourceKind::kPairedArtifact;
    r.stage = Stage::kPairs;
    r.locator = "agents/" + asset;
    r.format = DocumentFormat::kJson;
    r.pair_schema = schema;
    out.push_back(std::move(r));
  }
}

// ── engine ────────────────────────────────────────────────────────────────
void add_engine(std::vector<Resource>& out) {
  Resource r;
  r.id = "engine:mirror_loop";
  r.kind = ResourceKind::kFreshFile;
  r.stage = Stage::kEngine;
  r.locator = "scripts/mirror_loop_v0_3_plus.py";
  out.push_back(std::move(r));
}

// ── logs ──────────────────────────────────────────────────────────────────
void add_logs(std::vector<Resource>& out, double budget) {
  Resource run_csv;
  run_csv.id = "log:run_csv";
  run_csv.kind = ResourceKind::kAppendLog;
  run_csv.stage = Stage::kLogs;
  run_csv.locator = "logs/mirror_loop_unified_run.csv";
  run_csv.format = DocumentFormat::kCsv;
  run_csv.freshness_budget_minutes = budget;
  run_csv.required_keys = run_log_columns();
  out.push_back(std::move(run_csv));

  Resource decisions;
  decisions.id = "log:decisions_jsonl";
  decisions.kind = ResourceKind::kAppendLog;
  decisions.stage = Stage::kLogs;
  decisions.locator = "logs/mirror_loop_unified_decisions.jsonl";
  decisions.format = DocumentFormat::kJsonLines;
  decisions.freshness_budget_minutes = budget;
  out.push_back(std::move(decisions));
}

// ── analytics ─────────────────────────────────────────────────────────────
void add_analytics(std::vector<Resource>& out, double budget) {
  Resource r;
  r.id = "analytics:daily";
  r.kind = ResourceKind::kDirectory;
  r.stage = Stage::kAnalytics;
  r.locator = "reports/daily";
  r.latest_child = true;
  r.freshness_budget_minutes = budget;
  out.push_back(std::move(r));
}

// ── scheduler ─────────────────────────────────────────────────────────────
void add_scheduler(std::vector<Resource>& out, const std::string& pattern) {
  Resource r;
  r.id = "scheduler:" + pattern;
  r.kind = ResourceKind::kSchedulerTaskGroup;
  r.stage = Stage::kScheduler;
  r.locator = pattern;
  r.task_roles = {
      audit::TaskRole{"hourly", {"hourly", "chain", "loop"}},
      audit::TaskRole{"eod", {"eod", "daily"}},
  };
  out.push_back(std::move(r));
}

}  // namespace

std::vector<Resource> build_default_registry(const RegistryOptions& options) {
  std::vector<Resource> resources;
  add_folders(resources);
  add_ingest(resources, options.ingest_budget_minutes);
  add_pairs(resources);
  add_engine(resources);
  add_logs(resources, options.log_budget_minutes);
  add_analytics(resources, options.analytics_budget_minutes);
  add_scheduler(resources, options.task_pattern);
  return resources;
}

}  // namespace pipeaudit::registry
