#include "pipeaudit/app/audit_service.h"
#include "pipeaudit/audit/status.h"
#include "pipeaudit/core/clock.h"
#include "pipeaudit/fs/inmemory_filesystem.h"

#include <catch2/catch_test_macros.hpp>

#include "support/pipeline_fixture.h"
#include <algorithm>
#include <iterator>

using namespace pipeaudit;
using audit::AuditStatus;
using audit::FindingKind;
using audit::FindingLevel;
using testing::at_root;
using testing::fixed_now;
using testing::minutes_ago;

namespace {

// ScenarioFixture wires a healthy in-memory pipeline root and fake scheduler queries.
struct ScenarioFixture {
  fs::InMemoryFileSystem mem;
  testing::FakeTaskQuery structured{"systemd", testing::healthy_tasks()};
  testing::FakeTaskQuery fallback{"text", {}};
  core::FixedClock clock{fixed_now()};
  app::AuditRequest req;

  ScenarioFixture() {
    testing::populate_healthy_tree(mem);
    req.root = testing::kRoot;
  }

  audit::AuditReport run() {
    app::AuditServices services(mem, structured, fallback);
    return app::run_audit(req, services, clock);
  }
};

std::vector<audit::Finding> at_level(const audit::AuditReport& report, FindingLevel level) {
  std::vector<audit::Finding> out;
  std::copy_if(report.findings.begin(), report.findings.end(), std::back_inserter(out),
               [level](const audit::Finding& f) { return f.level == level; });
  return out;
}

}  // namespace

// ── Scenario A: healthy pipeline ────────────────────────────────────────────

TEST_CASE("run_audit: healthy pipeline is READY", "[app][scenario]") {
  ScenarioFixture f;
  const auto report = f.run();

  CHECK(report.findings.size() == 26);
  CHECK(at_level(report, FindingLevel::kWarn).empty());
  CHECK(at_level(report, FindingLevel::kError).empty());
  REQUIRE(at_level(report, FindingLevel::kInfo).size() == 1);
  CHECK(at_level(report, FindingLevel::kInfo)[0].message ==
        "heartbeat: 2026-01-01T11:55:00Z cycle=42 ok");
  CHECK(report.status == AuditStatus::kReady);

  CHECK(report.run_id == "audit-20260101_120000Z");
  CHECK(report.started_at == "2026-01-01T12:00:00Z");
  CHECK(report.completed_at == "2026-01-01T12:00:00Z");
  CHECK(report.root == "/pipe");
}

TEST_CASE("run_audit: findings follow stage order", "[app][scenario]") {
  ScenarioFixture f;
  const auto report = f.run();

  REQUIRE(report.findings.size() == 26);
  CHECK(report.findings.front().resource_id == "dir:agents");
  CHECK(report.findings[5].resource_id == "ingest:sentiment_index");
  CHECK(report.findings[9].resource_id == "pair:BTC");
  CHECK(report.findings[17].resource_id == "engine:mirror_loop");
  CHECK(report.findings.back().resource_id == "scheduler:OPRT");
}

TEST_CASE("run_audit: stage detail counts and resources", "[app][scenario]") {
  ScenarioFixture f;
  const auto report = f.run();

  const auto& stages = report.stage_detail;
  for (const char* stage :
       {"folders", "ingest", "pairs", "engine", "logs", "analytics", "scheduler"}) {
    REQUIRE(stages.contains(stage));
  }
  CHECK(stages["folders"]["counts"]["OK"] == 5);
  CHECK(stages["pairs"]["counts"]["OK"] == 8);
  CHECK(stages["engine"]["counts"]["INFO"] == 1);
  CHECK(stages["ingest"]["resources"]["ingest:pressure_btc"]["range"]["result"] == "in_range");
  CHECK(stages["logs"]["resources"]["log:decisions_jsonl"]["tail"].size() == 2);
  CHECK(stages["analytics"]["resources"]["analytics:daily"]["latest"] == "2025-12-31");
  CHECK(stages["scheduler"]["resources"]["scheduler:OPRT"]["source"] == "systemd");
}

// ── Scenario B: logs folder missing ─────────────────────────────────────────

TEST_CASE("run_audit: missing logs folder needs fixes", "[app][scenario]") {
  ScenarioFixture f;
  f.mem.remove(at_root("logs"));
  const auto report = f.run();

  const auto errors = at_level(report, FindingLevel::kError);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].resource_id == "dir:logs");
  CHECK(errors[0].message == "missing: logs");
  CHECK(report.status == AuditStatus::kNeedsFixes);

  const auto warns = at_level(report, FindingLevel::kWarn);
  REQUIRE(warns.size() == 2);
  CHECK(warns[0].message == "missing: logs/mirror_loop_unified_run.csv");
  CHECK(warns[1].message == "missing: logs/mirror_loop_unified_decisions.jsonl");
}

// ── Scenario C: non-numeric sentiment ───────────────────────────────────────

TEST_CASE("run_audit: non-numeric sentiment degrades", "[app][scenario]") {
  ScenarioFixture f;
  f.mem.add_file(at_root("data/sentiment_index.txt"), "N/A\n", minutes_ago(10));
  const auto report = f.run();

  const auto warns = at_level(report, FindingLevel::kWarn);
  REQUIRE(warns.size() == 1);
  CHECK(warns[0].resource_id == "ingest:sentiment_index");
  CHECK(warns[0].kind == FindingKind::kParseFailure);
  CHECK(warns[0].message == "not numeric: 'N/A'");
  CHECK(at_level(report, FindingLevel::kError).empty());
  CHECK(report.status == AuditStatus::kDegraded);
}

// ── Scenario D: flows missing a key ─────────────────────────────────────────

TEST_CASE("run_audit: flows without funding degrades", "[app][scenario]") {
  ScenarioFixture f;
  f.mem.add_file(at_root("data/flows_btc.json"),
                 R"({"ts_utc": "2026-01-01T11:50:00Z", "price": 97120.5, "volume_ratio": 1.3,
                     "oi": 1.52e10, "liq_skew": -0.2})",
                 minutes_ago(15));
  const auto report = f.run();

  const auto warns = at_level(report, FindingLevel::kWarn);
  REQUIRE(warns.size() == 1);
  CHECK(warns[0].resource_id == "ingest:flows_btc");
  CHECK(warns[0].kind == FindingKind::kInvalidSchema);
  CHECK(warns[0].message == "missing keys: funding");
  CHECK(report.status == AuditStatus::kDegraded);
}

// ── Scenario E: scheduler unavailable ───────────────────────────────────────

TEST_CASE("run_audit: no scheduler listing degrades, never fails", "[app][scenario]") {
  ScenarioFixture f;
  f.structured.fail_with("bus unavailable");
  f.fallback.fail_with("crontab exited with code 1");
  const auto report = f.run();

  CHECK(at_level(report, FindingLevel::kError).empty());
  CHECK(at_level(report, FindingLevel::kWarn).size() == 2);
  CHECK(report.status == AuditStatus::kDegraded);
}

// ── Determinism ─────────────────────────────────────────────────────────────

TEST_CASE("run_audit: repeated runs over the same tree are identical", "[app][determinism]") {
  ScenarioFixture f;
  f.mem.add_file(at_root("agents/SOL_A.json"), R"({"phase_vector": [1, 2, 3, 4]})",
                 minutes_ago(20));
  const auto first = f.run();
  const auto second = f.run();

  CHECK(first.findings == second.findings);
  CHECK(first.stage_detail == second.stage_detail);
  CHECK(first.status == second.status);
}

TEST_CASE("run_audit: concurrent evaluation keeps registry order", "[app][determinism]") {
  ScenarioFixture f;
  f.mem.remove(at_root("agents/ETH_B.json"));
  f.mem.add_file(at_root("data/sentiment_index.txt"), "0.4", minutes_ago(500));
  const auto sequential = f.run();

  f.req.jobs = 4;
  std::vector<std::string> streamed;
  app::AuditServices services(f.mem, f.structured, f.fallback);
  const auto concurrent = app::run_audit(f.req, services, f.clock, [&](const audit::Finding& x) {
    streamed.push_back(x.resource_id + " " + x.message);
  });

  CHECK(concurrent.findings == sequential.findings);
  CHECK(concurrent.stage_detail == sequential.stage_detail);
  REQUIRE(streamed.size() == sequential.findings.size());
  for (std::size_t i = 0; i < streamed.size(); ++i) {
    CHECK(streamed[i] == sequential.findings[i].resource_id + " " + sequential.findings[i].message);
  }
}

TEST_CASE("run_audit: smoke run goes through the injected runner", "[app][engine]") {
  ScenarioFixture f;
  testing::FakeSubprocessRunner runner;
  runner.respond("python3", process::SubprocessResult{1, "", "boom", false});
  f.req.engine.smoke_test = true;

  app::AuditServices services(f.mem, f.structured, f.fallback, &runner);
  const auto report = app::run_audit(f.req, services, f.clock);

  const auto warns = at_level(report, FindingLevel::kWarn);
  REQUIRE(warns.size() == 1);
  CHECK(warns[0].resource_id == "engine:mirror_loop");
  CHECK(warns[0].message == "smoke run exited with code 1");
  CHECK(runner.requests().size() == 1);
}
