#include "pipeaudit/checks/structured_file_checker.h"
#include "pipeaudit/core/clock.h"
#include "pipeaudit/fs/inmemory_filesystem.h"

#include <catch2/catch_test_macros.hpp>

#include "support/pipeline_fixture.h"

using namespace pipeaudit;
using audit::FindingKind;
using audit::FindingLevel;
using testing::at_root;
using testing::fixed_now;
using testing::minutes_ago;

namespace {

struct StructuredFixture {
  fs::InMemoryFileSystem mem;
  core::FixedClock clock{fixed_now()};

  checks::CheckOutcome run(const std::string& id) {
    const checks::CheckContext ctx{mem, clock, testing::kRoot, fixed_now()};
    return checks::check_structured_file(ctx, testing::default_resource(id));
  }
};

}  // namespace

// ── Numeric text ────────────────────────────────────────────────────────────

TEST_CASE("check_structured_file: numeric text value is recorded", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/sentiment_index.txt"), " 0.42\n", minutes_ago(10));

  const auto outcome = f.run("ingest:sentiment_index");
  REQUIRE(outcome.findings.size() == 1);
  CHECK(outcome.findings[0].level == FindingLevel::kOk);
  CHECK(outcome.detail["value"] == 0.42);
}

TEST_CASE("check_structured_file: non-numeric text is a parse WARN", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/sentiment_index.txt"), "N/A\n", minutes_ago(10));

  const auto outcome = f.run("ingest:sentiment_index");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[0].level == FindingLevel::kOk);
  CHECK(outcome.findings[1].level == FindingLevel::kWarn);
  CHECK(outcome.findings[1].kind == FindingKind::kParseFailure);
  CHECK(outcome.findings[1].message == "not numeric: 'N/A'");
  CHECK(outcome.detail["value"].is_null());
}

TEST_CASE("check_structured_file: stale and invalid yields two WARNs", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/sentiment_index.txt"), "", minutes_ago(200));

  const auto outcome = f.run("ingest:sentiment_index");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[0].kind == FindingKind::kStaleResource);
  CHECK(outcome.findings[1].kind == FindingKind::kParseFailure);
  CHECK(outcome.findings[1].message == "not numeric: ''");
}

TEST_CASE("check_structured_file: missing file yields only the freshness finding",
          "[checks][structured]") {
  StructuredFixture f;

  const auto outcome = f.run("ingest:flows_btc");
  REQUIRE(outcome.findings.size() == 1);
  CHECK(outcome.findings[0].level == FindingLevel::kWarn);
  CHECK(outcome.findings[0].message == "missing: data/flows_btc.json");
}

// ── CSV ─────────────────────────────────────────────────────────────────────

TEST_CASE("check_structured_file: quoted commas do not add columns", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/headlines.csv"),
                 "2026-01-01T11:40:00Z,\"Fed holds, signals patience\",0.3,reuters\n",
                 minutes_ago(5));

  const auto outcome = f.run("ingest:headlines");
  REQUIRE(outcome.findings.size() == 1);
  CHECK(outcome.detail["first_row_columns"] == 4);
}

TEST_CASE("check_structured_file: narrow CSV row is a schema WARN", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/headlines.csv"), "2026-01-01T11:40:00Z,ETF inflows\n",
                 minutes_ago(5));

  const auto outcome = f.run("ingest:headlines");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[1].kind == FindingKind::kInvalidSchema);
  CHECK(outcome.findings[1].message == "expected at least 4 columns, found 2");
}

TEST_CASE("check_structured_file: empty CSV is a parse WARN", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/headlines.csv"), "\n\n", minutes_ago(5));

  const auto outcome = f.run("ingest:headlines");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[1].kind == FindingKind::kParseFailure);
  CHECK(outcome.findings[1].message == "parse failed: empty document");
}

// ── JSON ────────────────────────────────────────────────────────────────────

TEST_CASE("check_structured_file: missing JSON keys are listed sorted", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/flows_btc.json"), R"({"ts_utc": "x", "price": 1, "oi": 2})",
                 minutes_ago(5));

  const auto outcome = f.run("ingest:flows_btc");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[1].level == FindingLevel::kWarn);
  CHECK(outcome.findings[1].kind == FindingKind::kInvalidSchema);
  CHECK(outcome.findings[1].message == "missing keys: funding, liq_skew, volume_ratio");
  CHECK(outcome.detail["missing_keys"].size() == 3);
}

TEST_CASE("check_structured_file: malformed JSON is a parse WARN", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/flows_btc.json"), R"({"ts_utc": )", minutes_ago(5));

  const auto outcome = f.run("ingest:flows_btc");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[1].kind == FindingKind::kParseFailure);
  CHECK(outcome.findings[1].message.starts_with("parse failed: "));
}

TEST_CASE("check_structured_file: pressure outside [-1, 1] is out of range",
          "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/pressure_btc.json"),
                 R"({"pressure": 1.0001, "components": {}, "source": "composite"})",
                 minutes_ago(5));

  const auto outcome = f.run("ingest:pressure_btc");
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[1].kind == FindingKind::kOutOfRangeValue);
  CHECK(outcome.findings[1].message == "pressure invalid or out of range");
  CHECK(outcome.detail["range"]["result"] == "out_of_range");
}

TEST_CASE("check_structured_file: pressure at the bound passes", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/pressure_btc.json"),
                 R"({"pressure": -1, "components": {}, "source": "composite"})",
                 minutes_ago(5));

  const auto outcome = f.run("ingest:pressure_btc");
  REQUIRE(outcome.findings.size() == 1);
  CHECK(outcome.detail["range"]["result"] == "in_range");
}

TEST_CASE("check_structured_file: absent pressure reports key and range", "[checks][structured]") {
  StructuredFixture f;
  f.mem.add_file(at_root("data/pressure_btc.json"), R"({"components": {}, "source": "x"})",
                 minutes_ago(5));

  const auto outcome = f.run("ingest:pressure_btc");
  REQUIRE(outcome.findings.size() == 3);
  CHECK(outcome.findings[1].message == "missing keys: pressure");
  CHECK(outcome.findings[2].message == "pressure invalid or out of range");
  CHECK(outcome.detail["range"]["result"] == "absent");
}
