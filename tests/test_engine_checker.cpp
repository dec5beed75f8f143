#include "pipeaudit/checks/engine_checker.h"
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

struct EngineFixture {
  fs::InMemoryFileSystem mem;
  core::FixedClock clock{fixed_now()};
  testing::FakeSubprocessRunner runner;
  checks::EngineCheckOptions options;

  EngineFixture() {
    mem.add_file(at_root("scripts/mirror_loop_v0_3_plus.py"), "print('loop')\n",
                 minutes_ago(600));
    mem.add_file(at_root("logs/engine_heartbeat.txt"), "cycle=1 ok\ncycle=2 ok\n\n",
                 minutes_ago(2));
  }

  checks::CheckOutcome run() {
    const checks::CheckContext ctx{mem, clock, testing::kRoot, fixed_now()};
    return checks::check_engine(ctx, testing::default_resource("engine:mirror_loop"), options,
                                &runner);
  }
};

}  // namespace

// ── Test 1: presence and heartbeat ──────────────────────────────────────────

TEST_CASE("check_engine: presence and heartbeat without smoke run", "[checks][engine]") {
  EngineFixture f;

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[0].level == FindingLevel::kOk);
  CHECK(outcome.findings[0].message == "present: scripts/mirror_loop_v0_3_plus.py");
  CHECK(outcome.findings[1].level == FindingLevel::kInfo);
  CHECK(outcome.findings[1].message == "heartbeat: cycle=2 ok");
  CHECK(outcome.detail["smoke"] == "disabled");
  CHECK(f.runner.requests().empty());
}

TEST_CASE("check_engine: missing heartbeat is informational", "[checks][engine]") {
  EngineFixture f;
  f.mem.remove(at_root("logs/engine_heartbeat.txt"));

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[1].level == FindingLevel::kInfo);
  CHECK(outcome.findings[1].message == "no heartbeat in logs/engine_heartbeat.txt");
  CHECK(outcome.detail["heartbeat"].is_null());
}

TEST_CASE("check_engine: missing engine skips the smoke run", "[checks][engine]") {
  EngineFixture f;
  f.mem.remove(at_root("scripts/mirror_loop_v0_3_plus.py"));
  f.options.smoke_test = true;

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 2);
  CHECK(outcome.findings[0].level == FindingLevel::kWarn);
  CHECK(outcome.findings[0].kind == FindingKind::kMissingResource);
  CHECK(outcome.detail["smoke"] == "skipped: engine missing");
  CHECK(f.runner.requests().empty());
}

// ── Test 2: smoke run ───────────────────────────────────────────────────────

TEST_CASE("check_engine: smoke run arguments are anchored at the root", "[checks][engine]") {
  EngineFixture f;
  f.options.smoke_test = true;
  f.options.python = "python3";
  f.options.smoke_timeout = std::chrono::seconds{30};
  f.runner.respond("python3", process::SubprocessResult{0, "cycle ok\n", "", false});

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 3);
  CHECK(outcome.findings[2].level == FindingLevel::kOk);
  CHECK(outcome.findings[2].message == "smoke run ok");

  const auto requests = f.runner.requests();
  REQUIRE(requests.size() == 1);
  CHECK(requests[0].working_directory == std::optional<std::string>("/pipe"));
  CHECK(requests[0].timeout == std::chrono::seconds{30});

  const std::vector<std::string> expected = {"/pipe/scripts/mirror_loop_v0_3_plus.py",
                                             "--agents_dir",
                                             "/pipe/agents",
                                             "--csv",
                                             "/pipe/logs/mirror_loop_unified_run.csv",
                                             "--jsonl",
                                             "/pipe/logs/mirror_loop_unified_decisions.jsonl",
                                             "--data_dir",
                                             "/pipe/data",
                                             "--heartbeat",
                                             "/pipe/logs/engine_heartbeat.txt",
                                             "--experiment_id",
                                             "audit_smoke"};
  CHECK(requests[0].args == expected);
  CHECK(outcome.detail["smoke"]["exit_code"] == 0);
  CHECK(outcome.detail["smoke"]["stdout_tail"] == "cycle ok\n");
}

TEST_CASE("check_engine: nonzero smoke exit is a WARN", "[checks][engine]") {
  EngineFixture f;
  f.options.smoke_test = true;
  f.runner.respond("python3", process::SubprocessResult{2, "", "Traceback ...", false});

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 3);
  CHECK(outcome.findings[2].level == FindingLevel::kWarn);
  CHECK(outcome.findings[2].kind == FindingKind::kSubprocessFailure);
  CHECK(outcome.findings[2].message == "smoke run exited with code 2");
}

TEST_CASE("check_engine: smoke timeout is a WARN", "[checks][engine]") {
  EngineFixture f;
  f.options.smoke_test = true;
  f.options.smoke_timeout = std::chrono::seconds{5};
  f.runner.respond("python3", process::SubprocessResult{137, "", "", true});

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 3);
  CHECK(outcome.findings[2].level == FindingLevel::kWarn);
  CHECK(outcome.findings[2].message == "smoke run timed out after 5s");
}

TEST_CASE("check_engine: interpreter that cannot start is a WARN", "[checks][engine]") {
  EngineFixture f;
  f.options.smoke_test = true;
  f.options.python = "python-missing";

  const auto outcome = f.run();
  REQUIRE(outcome.findings.size() == 3);
  CHECK(outcome.findings[2].level == FindingLevel::kWarn);
  CHECK(outcome.findings[2].kind == FindingKind::kSubprocessFailure);
  CHECK(outcome.findings[2].message ==
        "smoke run failed to start: failed to start 'python-missing': No such file or "
        "directory");
}
