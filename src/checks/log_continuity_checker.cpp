#include "pipeaudit/checks/log_continuity_checker.h"

#include "pipeaudit/checks/freshness_checker.h"
#include "pipeaudit/checks/schema_validator.h"
#include "pipeaudit/core/text.h"

#include <algorithm>

namespace pipeaudit::checks {

using audit::DocumentFormat;
using audit::FindingKind;
using audit::FindingLevel;

const std::vector<std::string>& latest_record_fields() {
  static const std::vector<std::string> kFields = {
      "signal", "C_eff", "phase_angle_deg", "volume_ratio", "trap_T", "herald_ok"};
  return kFields;
}

std::string summarize_record(const nlohmann::json& record) {
  std::vector<std::string> parts;
  for (const auto& field : latest_record_fields()) {
    auto it = record.find(field);
    std::string value = "-";
    if (it != record.end() && !it->is_null()) {
      value = it->is_string() ? it->get<std::string>() : it->dump();
    }
    parts.push_back(field + "=" + value);
  }
  return core::join(parts, " ");
}

namespace {

void check_header(const CheckContext& ctx, const audit::Resource& resource,
                  const std::string& text, CheckOutcome& outcome) {
  auto row = parse_csv_first_row(text);
  if (!row.has_value()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: " + row.error()));
    return;
  }

  const auto missing = missing_columns(row.value(), resource.required_keys);
  outcome.detail["missing_columns"] = missing;
  if (missing.empty()) {
    outcome.findings.push_back(make_finding(
        ctx, resource, FindingLevel::kOk, FindingKind::kNone,
        "header ok (" + std::to_string(resource.required_keys.size()) + " required columns)"));
    return;
  }

  std::vector<std::string> expected = resource.required_keys;
  std::sort(expected.begin(), expected.end());
  outcome.findings.push_back(make_finding(
      ctx, resource, FindingLevel::kWarn, FindingKind::kInvalidSchema,
      "header incomplete, expected: " + core::join(expected, ", ") +
          " (missing: " + core::join(missing, ", ") + ")"));
}

void check_latest_record(const CheckContext& ctx, const audit::Resource& resource,
                         const std::string& text, CheckOutcome& outcome) {
  const std::string last = core::last_non_empty_line(text);
  if (last.empty()) {
    outcome.detail["latest_record"] = nullptr;
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: empty tail"));
    return;
  }

  auto record = parse_json_document(last);
  if (!record.has_value()) {
    outcome.detail["latest_record"] = nullptr;
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: " + record.error()));
    return;
  }

  nlohmann::json preview = nlohmann::json::object();
  for (const auto& field : latest_record_fields()) {
    auto it = record.value().find(field);
    preview[field] = it != record.value().end() ? *it : nlohmann::json(nullptr);
  }
  outcome.detail["latest_record"] = preview;
  outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kOk, FindingKind::kNone,
                                          "latest record: " + summarize_record(record.value())));
}

}  // namespace

CheckOutcome check_append_log(const CheckContext& ctx, const audit::Resource& resource) {
  CheckOutcome outcome = check_freshness(ctx, resource);
  if (!outcome.detail.value("present", false)) {
    return outcome;
  }

  const auto text = ctx.fs.read_text(ctx.resolve(resource.locator));
  if (!text.has_value()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: unreadable file"));
    return outcome;
  }

  outcome.detail["tail"] = core::tail_lines(text.value(), ctx.tail_lines);

  if (resource.format == DocumentFormat::kCsv) {
    check_header(ctx, resource, text.value(), outcome);
  } else if (resource.format == DocumentFormat::kJsonLines) {
    check_latest_record(ctx, resource, text.value(), outcome);
  }
  return outcome;
}

}  // namespace pipeaudit::checks
