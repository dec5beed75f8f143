#include "pipeaudit/checks/paired_artifact_validator.h"

#include "pipeaudit/checks/schema_validator.h"

namespace pipeaudit::checks {

using audit::FindingKind;
using audit::FindingLevel;

namespace {

bool block_has_fields(const nlohmann::json& doc, const std::string& block,
                      const std::vector<std::string>& fields) {
  auto it = doc.find(block);
  if (it == doc.end() || !it->is_object()) {
    return false;
  }
  for (const auto& field : fields) {
    if (!it->contains(field)) {
      return false;
    }
  }
  return true;
}

std::string bool_text(bool value) { return value ? "true" : "false"; }

}  // namespace

PairEvaluation evaluate_pair_schema(const nlohmann::json& primary,
                                    const audit::PairSchema& schema) {
  PairEvaluation eval;

  auto vec = primary.find(schema.vector_key);
  if (vec != primary.end() && vec->is_array()) {
    eval.vector_length = vec->size();
  }
  eval.vector_ok = eval.vector_length == schema.vector_length;
  eval.alignment_ok = block_has_fields(primary, schema.alignment_block, schema.alignment_fields);
  eval.indicators_ok = block_has_fields(primary, schema.indicator_block, schema.indicator_fields);
  return eval;
}

CheckOutcome check_paired_artifact(const CheckContext& ctx, const audit::Resource& resource) {
  const audit::PairSchema schema = resource.pair_schema.value_or(audit::PairSchema{});
  const std::string primary_locator = resource.locator + schema.primary_suffix;
  const std::string secondary_locator = resource.locator + schema.secondary_suffix;

  const std::string primary_path = ctx.resolve(primary_locator);
  const bool primary_present = ctx.fs.exists(primary_path);
  const bool secondary_present = ctx.fs.exists(ctx.resolve(secondary_locator));

  CheckOutcome outcome;
  outcome.detail["primary"] = primary_locator;
  outcome.detail["secondary"] = secondary_locator;
  outcome.detail["primary_present"] = primary_present;
  outcome.detail["secondary_present"] = secondary_present;

  if (!primary_present || !secondary_present) {
    std::string absent;
    if (!primary_present) {
      absent = primary_locator;
    }
    if (!secondary_present) {
      absent += absent.empty() ? secondary_locator : ", " + secondary_locator;
    }
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kMissingResource,
                                            "missing A or B (" + absent + ")"));
    return outcome;
  }

  const auto text = ctx.fs.read_text(primary_path);
  auto doc = text.has_value()
                 ? parse_json_document(text.value())
                 : core::Result<nlohmann::json, std::string>::err("unreadable file");
  if (!doc.has_value()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kParseFailure,
                                            "parse failed: " + doc.error()));
    return outcome;
  }

  const PairEvaluation eval = evaluate_pair_schema(doc.value(), schema);
  const std::string length_key = schema.vector_key + "_len";
  const std::string alignment_key = schema.alignment_block + "_ok";
  const std::string indicators_key = schema.indicator_block + "_ok";

  outcome.detail[length_key] = eval.vector_length;
  outcome.detail[alignment_key] = eval.alignment_ok;
  outcome.detail[indicators_key] = eval.indicators_ok;

  const std::string values = "(" + length_key + "=" + std::to_string(eval.vector_length) + ", " +
                             alignment_key + "=" + bool_text(eval.alignment_ok) + ", " +
                             indicators_key + "=" + bool_text(eval.indicators_ok) + ")";
  if (eval.passed()) {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kOk, FindingKind::kNone,
                                            "schema ok " + values));
  } else {
    outcome.findings.push_back(make_finding(ctx, resource, FindingLevel::kWarn,
                                            FindingKind::kInvalidSchema,
                                            "schema incomplete " + values));
  }
  return outcome;
}

}  // namespace pipeaudit::checks
