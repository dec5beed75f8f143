#include "pipeaudit/report/report_assembler.h"

#include <catch2/catch_test_macros.hpp>

#include "support/pipeline_fixture.h"
#include <fstream>
#include <sstream>

using namespace pipeaudit;
using testing::fixed_now;

namespace {

nlohmann::json read_json(const std::string& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return nlohmann::json::parse(buffer.str());
}

}  // namespace

// ── Serialization ───────────────────────────────────────────────────────────

TEST_CASE("report_to_json: document layout", "[report]") {
  const auto report = testing::sample_report("audit-20260101_120000Z", "2026-01-01T12:00:00Z");
  const auto doc = report::report_to_json(report);

  CHECK(doc["format"] == "pipeaudit.report/1");
  CHECK(doc["version"] == "0.3");
  CHECK(doc["run_id"] == "audit-20260101_120000Z");
  CHECK(doc["root"] == "/pipe");
  CHECK(doc["status"] == "DEGRADED");
  CHECK(doc["counts"]["OK"] == 2);
  CHECK(doc["counts"]["INFO"] == 1);
  CHECK(doc["counts"]["WARN"] == 1);
  CHECK(doc["counts"]["ERROR"] == 0);
  REQUIRE(doc["findings"].size() == 4);
  CHECK(doc["findings"][2]["level"] == "WARN");
  CHECK(doc["findings"][2]["kind"] == "invalid_schema");
  CHECK(doc["findings"][2]["resource_id"] == "ingest:flows_btc");
  CHECK(doc["stages"]["folders"]["counts"]["OK"] == 2);
}

TEST_CASE("report_to_json: status is derived from findings", "[report]") {
  auto report = testing::sample_report("audit-x", "2026-01-01T12:00:00Z");
  report.status = audit::AuditStatus::kReady;
  report.findings.push_back(testing::make_test_finding(audit::FindingLevel::kError, "dir:logs",
                                                       "missing: logs",
                                                       audit::FindingKind::kMissingResource));

  CHECK(report::report_to_json(report)["status"] == "NEEDS_FIXES");
}

TEST_CASE("report_file_name: UTC stamp of the run start", "[report]") {
  CHECK(report::report_file_name(fixed_now()) == "audit_20260101_120000Z.json");
}

// ── Persistence ─────────────────────────────────────────────────────────────

TEST_CASE("write_report: creates the directory and writes the document", "[report]") {
  testing::TempDir dir("report_write");
  auto report = testing::sample_report("audit-1", "2026-01-01T12:00:00Z");

  const auto written = report::write_report(report, dir.file("reports/audit"), fixed_now());
  REQUIRE(written.has_value());
  CHECK(written.value() == dir.file("reports/audit/audit_20260101_120000Z.json"));
  CHECK(report.run_id == "audit-1");

  const auto doc = read_json(written.value());
  CHECK(doc == report::report_to_json(report));
}

TEST_CASE("write_report: never overwrites an existing report", "[report]") {
  testing::TempDir dir("report_suffix");
  auto first = testing::sample_report("audit-1", "2026-01-01T12:00:00Z");
  auto second = testing::sample_report("audit-2", "2026-01-01T12:00:00Z");
  auto third = testing::sample_report("audit-3", "2026-01-01T12:00:00Z");

  const auto a = report::write_report(first, dir.path(), fixed_now());
  const auto b = report::write_report(second, dir.path(), fixed_now());
  const auto c = report::write_report(third, dir.path(), fixed_now());
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());

  CHECK(b.value() == dir.file("audit_20260101_120000Z_1.json"));
  CHECK(c.value() == dir.file("audit_20260101_120000Z_2.json"));
  CHECK(read_json(a.value())["run_id"] == "audit-1");
  CHECK(read_json(b.value())["run_id"] == "audit-2_1");
  CHECK(second.run_id == "audit-2_1");
  CHECK(third.run_id == "audit-3_2");
}

TEST_CASE("write_report: unusable directory is an error", "[report]") {
  testing::TempDir dir("report_blocked");
  {
    std::ofstream blocker(dir.file("not_a_dir"));
    blocker << "x";
  }

  auto report = testing::sample_report("audit-1", "x");
  const auto written = report::write_report(report, dir.file("not_a_dir/audit"), fixed_now());
  REQUIRE_FALSE(written.has_value());
  CHECK(report.run_id == "audit-1");
  CHECK(written.error().find("cannot create report directory") != std::string::npos);
}

TEST_CASE("render_report: bytes that are not UTF-8 are replaced, not rejected", "[report]") {
  auto report = testing::sample_report("audit-1", "2026-01-01T12:00:00Z");
  report.findings.push_back(testing::make_test_finding(
      audit::FindingLevel::kOk, "logs:run", "latest row: caf\xE9"));
  report.stage_detail["logs"]["tail"] = nlohmann::json::array({"2026-01-01,caf\xE9"});

  const std::string text = report::render_report(report);
  const auto doc = nlohmann::json::parse(text);
  CHECK(doc["findings"].back()["message"] == "latest row: caf\xEF\xBF\xBD");
  CHECK(doc["stages"]["logs"]["tail"][0] == "2026-01-01,caf\xEF\xBF\xBD");
}
