#include "pipeaudit/app/audit_service.h"

#include "pipeaudit/audit/status.h"
#include "pipeaudit/checks/directory_checker.h"
#include "pipeaudit/checks/freshness_checker.h"
#include "pipeaudit/checks/log_continuity_checker.h"
#include "pipeaudit/checks/paired_artifact_validator.h"
#include "pipeaudit/checks/structured_file_checker.h"
#include "pipeaudit/report/report_assembler.h"
#include "pipeaudit/scheduler/scheduler_inspector.h"

#include <deque>
#include <future>
#include <utility>
#include <vector>

namespace pipeaudit::app {

namespace {

void add_counts(nlohmann::json& counts, const std::vector<audit::Finding>& findings) {
  for (const auto& finding : findings) {
    const std::string level(audit::to_string(finding.level));
    counts[level] = counts[level].get<std::size_t>() + 1;
  }
}

nlohmann::json empty_counts() {
  return {{"OK", 0}, {"INFO", 0}, {"WARN", 0}, {"ERROR", 0}};
}

}  // namespace

std::string default_out_dir(const std::string& root) {
  return fs::join_path(root, "reports/audit");
}

std::string run_id_for(const core::Timestamp started_at) {
  return "audit-" + core::format_file_stamp_utc(started_at);
}

checks::CheckOutcome evaluate_resource(const checks::CheckContext& ctx,
                                       const audit::Resource& resource, const AuditRequest& req,
                                       AuditServices& services) {
  switch (resource.kind) {
    case audit::ResourceKind::kDirectory:
      return checks::check_directory(ctx, resource);
    case audit::ResourceKind::kFreshFile:
      if (resource.stage == audit::Stage::kEngine) {
        return checks::check_engine(ctx, resource, req.engine, services.runner);
      }
      return checks::check_freshness(ctx, resource);
    case audit::ResourceKind::kStructuredFile:
      return checks::check_structured_file(ctx, resource);
    case audit::ResourceKind::kPairedArtifact:
      return checks::check_paired_artifact(ctx, resource);
    case audit::ResourceKind::kAppendLog:
      return checks::check_append_log(ctx, resource);
    case audit::ResourceKind::kSchedulerTaskGroup: {
      const scheduler::SchedulerInspector inspector(services.structured_tasks,
                                                    services.fallback_tasks);
      return inspector.inspect(ctx, resource);
    }
  }
  return checks::check_freshness(ctx, resource);
}

audit::AuditReport run_audit(const AuditRequest& req, AuditServices& services,
                             core::IClock& clock, const FindingSink& sink) {
  const core::Timestamp started = clock.now();
  const checks::CheckContext ctx{services.fs, clock, req.root, started, req.tail_lines};
  const auto resources = registry::build_default_registry(req.registry);

  audit::AuditReport report;
  report.run_id = run_id_for(started);
  report.started_at = core::format_iso8601_utc(started);
  report.root = req.root;

  std::vector<checks::CheckOutcome> outcomes(resources.size());

  // Outcomes are consumed strictly in registry order, whichever task finishes first.
  auto consume = [&](std::size_t index, checks::CheckOutcome outcome) {
    if (sink) {
      for (const auto& finding : outcome.findings) {
        sink(finding);
      }
    }
    outcomes[index] = std::move(outcome);
  };

  if (req.jobs <= 1) {
    for (std::size_t i = 0; i < resources.size(); ++i) {
      consume(i, evaluate_resource(ctx, resources[i], req, services));
    }
  } else {
    std::deque<std::pair<std::size_t, std::future<checks::CheckOutcome>>> in_flight;
    std::size_t next = 0;
    while (next < resources.size() || !in_flight.empty()) {
      while (next < resources.size() && in_flight.size() < req.jobs) {
        const auto& resource = resources[next];
        in_flight.emplace_back(next, std::async(std::launch::async, [&ctx, &resource, &req,
                                                                     &services]() {
                                 return evaluate_resource(ctx, resource, req, services);
                               }));
        ++next;
      }
      auto [index, future] = std::move(in_flight.front());
      in_flight.pop_front();
      consume(index, future.get());
    }
  }

  // ── merge ───────────────────────────────────────────────────────────────
  for (std::size_t i = 0; i < resources.size(); ++i) {
    const auto& resource = resources[i];
    auto& outcome = outcomes[i];

    const std::string stage(audit::to_string(resource.stage));
    auto& stage_json = report.stage_detail[stage];
    if (!stage_json.contains("counts")) {
      stage_json["counts"] = empty_counts();
      stage_json["resources"] = nlohmann::json::object();
    }
    add_counts(stage_json["counts"], outcome.findings);
    stage_json["resources"][resource.id] = std::move(outcome.detail);

    for (auto& finding : outcome.findings) {
      report.findings.push_back(std::move(finding));
    }
  }

  report.status = audit::compute_status(report.findings);
  report.completed_at = clock.now_iso8601();
  return report;
}

core::Result<AuditPipelineResponse, std::string> run_audit_pipeline(const AuditRequest& req,
                                                                    AuditServices& services,
                                                                    core::IClock& clock,
                                                                    const FindingSink& sink) {
  using PipelineResult = core::Result<AuditPipelineResponse, std::string>;

  AuditPipelineResponse response;
  response.report = run_audit(req, services, clock, sink);

  // The file stamp has second precision, as does started_at.
  const auto started = core::parse_iso8601_utc(response.report.started_at);
  if (!started.has_value()) {
    return PipelineResult::err("invalid run start: " + response.report.started_at);
  }

  const std::string out_dir = req.out_dir.value_or(default_out_dir(req.root));
  auto written = report::write_report(response.report, out_dir, started.value());
  if (!written.has_value()) {
    return PipelineResult::err(written.error());
  }
  response.report_path = written.value();

  if (services.history != nullptr) {
    auto recorded = services.history->record_run(response.report, response.report_path);
    if (!recorded.has_value()) {
      response.history_error = recorded.error();
    }
  }

  return PipelineResult::ok(std::move(response));
}

}  // namespace pipeaudit::app
