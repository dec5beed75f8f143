#include "pipeaudit/checks/structured_file_checker.h"

#include "pipeaudit/checks/freshness_checker.h"
#include "pipeaudit/checks/schema_validator.h"
#include "pipeaudit/core/text.h"

namespace pipeaudit::checks {

using audit::DocumentFormat;
using audit::FindingKind;
using audit::FindingLevel;

namespace {

constexpr std::size_t kMaxQuotedValueChars = 40;

void check_numeric_text(const CheckContext& ctx, const audit::Resource& resource,
                        const std::string& text, CheckOutcome& outcome) {
  const auto value = parse_numeric_text(text);
  if (!value.has_value()) {
    const std::string shown = core::truncate_head(core::trim(text), kMaxQuotedValueChars);
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "not numeric: '" + shown + "'"));
    outcome.detail["value"] = nullptr;
    return;
  }
  outcome.detail["value"] = value.value();
}

void check_csv(const CheckContext& ctx, const audit::Resource& resource, const std::string& text,
               CheckOutcome& outcome) {
  auto row = parse_csv_first_row(text);
  if (!row.has_value()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: " + row.error()));
    return;
  }

  const std::size_t columns = row.value().size();
  outcome.detail["first_row_columns"] = columns;
  if (columns < resource.min_columns) {
    outcome.findings.push_back(make_finding(
        ctx, resource, FindingLevel::kWarn, FindingKind::kInvalidSchema,
        "expected at least " + std::to_string(resource.min_columns) + " columns, found " +
            std::to_string(columns)));
  }
}

void check_json(const CheckContext& ctx, const audit::Resource& resource, const std::string& text,
                CheckOutcome& outcome) {
  auto doc = parse_json_document(text);
  if (!doc.has_value()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: " + doc.error()));
    return;
  }

  const auto missing = missing_keys(doc.value(), resource.required_keys);
  outcome.detail["missing_keys"] = missing;
  if (!missing.empty()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kInvalidSchema,
                                            format_missing_keys(missing)));
  }

  if (resource.numeric_range.has_value()) {
    const auto& range = resource.numeric_range.value();
    const RangeCheck check = check_numeric_range(doc.value(), range);
    outcome.detail["range"] = {{"key", range.key},
                               {"min", range.min},
                               {"max", range.max},
                               {"result", std::string(to_string(check))}};
    if (check != RangeCheck::kInRange) {
      outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                              FindingKind::kOutOfRangeValue,
                                              range.key + " invalid or out of range"));
    }
  }
}

}  // namespace

CheckOutcome check_structured_file(const CheckContext& ctx, const audit::Resource& resource) {
  CheckOutcome outcome = check_freshness(ctx, resource);
  if (!outcome.detail.value("present", false) || resource.format == DocumentFormat::kNone) {
    return outcome;
  }

  const auto text = ctx.fs.read_text(ctx.resolve(resource.locator));
  if (!text.has_value()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: unreadable file"));
    return outcome;
  }

  switch (resource.format) {
    case DocumentFormat::kNumericText:
      check_numeric_text(ctx, resource, text.value(), outcome);
      break;
    case DocumentFormat::kCsv:
      check_csv(ctx, resource, text.value(), outcome);
      break;
    case DocumentFormat::kJson:
      check_json(ctx, resource, text.value(), outcome);
      break;
    case DocumentFormat::kJsonLines:
    case DocumentFormat::kNone:
      break;
  }
  return outcome;
}

}  // namespace pipeaudit::checks
