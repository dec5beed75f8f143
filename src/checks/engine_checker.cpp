#include "pipeaudit/checks/engine_checker.h"

#include "pipeaudit/checks/freshness_checker.h"
#include "pipeaudit/core/text.h"

namespace pipeaudit::checks {

using audit::FindingKind;
using audit::FindingLevel;

std::vector<std::string> smoke_arguments(const CheckContext& ctx, const audit::Resource& resource,
                                         const EngineCheckOptions& options) {
  return {ctx.resolve(resource.locator),
          "--agents_dir",
          ctx.resolve("agents"),
          "--csv",
          ctx.resolve("logs/mirror_loop_unified_run.csv"),
          "--jsonl",
          ctx.resolve("logs/mirror_loop_unified_decisions.jsonl"),
          "--data_dir",
          ctx.resolve("data"),
          "--heartbeat",
          ctx.resolve(options.heartbeat_locator),
          "--experiment_id",
          "audit_smoke"};
}

namespace {

void report_heartbeat(const CheckContext& ctx, const audit::Resource& resource,
                      const EngineCheckOptions& options, CheckOutcome& outcome) {
  const auto text = ctx.fs.read_text(ctx.resolve(options.heartbeat_locator));
  const std::string line = text.has_value() ? core::last_non_empty_line(text.value()) : "";
  if (line.empty()) {
    outcome.detail["heartbeat"] = nullptr;
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kInfo,
                                            FindingKind::kNone,
                                            "no heartbeat in " + options.heartbeat_locator));
    return;
  }
  outcome.detail["heartbeat"] = line;
  outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kInfo, FindingKind::kNone,
                                          "heartbeat: " + line));
}

void run_smoke(const CheckContext& ctx, const audit::Resource& resource,
               const EngineCheckOptions& options, process::ISubprocessRunner& runner,
               CheckOutcome& outcome) {
  process::SubprocessRequest request;
  request.program = options.python;
  request.args = smoke_arguments(ctx, resource, options);
  request.working_directory = ctx.root;
  request.timeout = options.smoke_timeout;

  nlohmann::json smoke;
  smoke["command"] = options.python + " " + core::join(request.args, " ");

  auto run = runner.run(request);
  if (!run.has_value()) {
    smoke["error"] = run.error();
    outcome.detail["smoke"] = smoke;
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kSubprocessFailure,
                                            "smoke run failed to start: " + run.error()));
    return;
  }

  const auto& result = run.value();
  smoke["exit_code"] = result.exit_code;
  smoke["timed_out"] = result.timed_out;
  smoke["stdout_tail"] = core::truncate_tail(result.stdout_text, kSmokeOutputTailChars);
  smoke["stderr_tail"] = core::truncate_tail(result.stderr_text, kSmokeOutputTailChars);
  outcome.detail["smoke"] = smoke;

  if (result.timed_out) {
    outcome.findings.push_back(make_finding(
        ctx, resource, FindingLevel::kWarn, FindingKind::kSubprocessFailure,
        "smoke run timed out after " + std::to_string(options.smoke_timeout.count()) + "s"));
  } else if (result.exit_code != 0) {
    outcome.findings.push_back(make_finding(
        ctx, resource, FindingLevel::kWarn, FindingKind::kSubprocessFailure,
        "smoke run exited with code " + std::to_string(result.exit_code)));
  } else {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kOk, FindingKind::kNone,
                                            "smoke run ok"));
  }
}

}  // namespace

CheckOutcome check_engine(const CheckContext& ctx, const audit::Resource& resource,
                          const EngineCheckOptions& options,
                          process::ISubprocessRunner* runner) {
  CheckOutcome outcome = check_freshness(ctx, resource);
  const bool present = outcome.detail.value("present", false);

  report_heartbeat(ctx, resource, options, outcome);

  if (!options.smoke_test) {
    outcome.detail["smoke"] = "disabled";
    return outcome;
  }
  if (!present) {
    outcome.detail["smoke"] = "skipped: engine missing";
    return outcome;
  }
  if (runner == nullptr) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kSubprocessFailure,
                                            "smoke run failed to start: no subprocess runner"));
    return outcome;
  }
  run_smoke(ctx, resource, options, *runner, outcome);
  return outcome;
}

}  // namespace pipeaudit::checks
