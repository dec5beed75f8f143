#include "pipeaudit/checks/schema_validator.h"

#include <catch2/catch_test_macros.hpp>

using namespace pipeaudit;
using checks::RangeCheck;

// ── Parsing ─────────────────────────────────────────────────────────────────

TEST_CASE("parse_json_document: objects only", "[checks][schema]") {
  CHECK(checks::parse_json_document(R"({"pressure": 0.1})").has_value());
  CHECK(checks::parse_json_document("\xEF\xBB\xBF{\"a\": 1}\n").has_value());

  const auto array = checks::parse_json_document("[1, 2]");
  REQUIRE_FALSE(array.has_value());
  CHECK(array.error() == "expected a JSON object");

  const auto empty = checks::parse_json_document("   \n");
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error() == "empty document");

  const auto truncated = checks::parse_json_document(R"({"pressure": 0.)");
  REQUIRE_FALSE(truncated.has_value());
  CHECK_FALSE(truncated.error().empty());
}

TEST_CASE("parse_csv_first_row: skips leading blank lines", "[checks][schema]") {
  const auto row = checks::parse_csv_first_row("\n\n a,b ,c\nx,y\n");
  REQUIRE(row.has_value());
  REQUIRE(row.value().size() == 3);
  CHECK(row.value()[1] == "b");

  CHECK_FALSE(checks::parse_csv_first_row("").has_value());
}

TEST_CASE("parse_numeric_text: single finite number with whitespace", "[checks][schema]") {
  CHECK(checks::parse_numeric_text("0.42\n") == std::optional<double>(0.42));
  CHECK(checks::parse_numeric_text("  -3e-2 ") == std::optional<double>(-0.03));
  CHECK_FALSE(checks::parse_numeric_text("N/A").has_value());
  CHECK_FALSE(checks::parse_numeric_text("").has_value());
  CHECK_FALSE(checks::parse_numeric_text("1.2x").has_value());
  CHECK_FALSE(checks::parse_numeric_text("0.4 0.5").has_value());
  CHECK_FALSE(checks::parse_numeric_text("nan").has_value());
  CHECK_FALSE(checks::parse_numeric_text("inf").has_value());
}

// ── Key presence ────────────────────────────────────────────────────────────

TEST_CASE("find_path: resolves dotted paths through objects", "[checks][schema]") {
  const auto doc = nlohmann::json::parse(R"({"components": {"flows": 0.2}, "source": "x"})");
  REQUIRE(checks::find_path(doc, "components.flows") != nullptr);
  CHECK(*checks::find_path(doc, "components.flows") == 0.2);
  CHECK(checks::find_path(doc, "components.sentiment") == nullptr);
  CHECK(checks::find_path(doc, "source.inner") == nullptr);
}

TEST_CASE("missing_keys: sorted and de-duplicated", "[checks][schema]") {
  const auto doc = nlohmann::json::parse(R"({"price": 1, "oi": 2})");
  const auto missing =
      checks::missing_keys(doc, {"ts_utc", "price", "funding", "oi", "funding", "liq_skew"});
  REQUIRE(missing.size() == 3);
  CHECK(missing[0] == "funding");
  CHECK(missing[1] == "liq_skew");
  CHECK(missing[2] == "ts_utc");
  CHECK(checks::format_missing_keys(missing) == "missing keys: funding, liq_skew, ts_utc");
}

TEST_CASE("missing_columns: column order is irrelevant", "[checks][schema]") {
  const std::vector<std::string> row = {"price", "asset", "signal"};
  CHECK(checks::missing_columns(row, {"signal", "asset", "price"}).empty());

  const auto missing = checks::missing_columns(row, {"trap_T", "asset", "C_eff"});
  REQUIRE(missing.size() == 2);
  CHECK(missing[0] == "C_eff");
  CHECK(missing[1] == "trap_T");
}

// ── Range rules ─────────────────────────────────────────────────────────────

TEST_CASE("check_numeric_range: closed interval bounds", "[checks][schema]") {
  const audit::NumericRange range{"pressure", -1.0, 1.0};

  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", -1.0}}, range) ==
        RangeCheck::kInRange);
  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", 1}}, range) ==
        RangeCheck::kInRange);
  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", 1.0001}}, range) ==
        RangeCheck::kOutOfRange);
  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", -1.0001}}, range) ==
        RangeCheck::kOutOfRange);
}

TEST_CASE("check_numeric_range: absent and non-numeric values", "[checks][schema]") {
  const audit::NumericRange range{"pressure", -1.0, 1.0};

  CHECK(checks::check_numeric_range(nlohmann::json::object(), range) == RangeCheck::kAbsent);
  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", nullptr}}, range) ==
        RangeCheck::kAbsent);
  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", "0.3"}}, range) ==
        RangeCheck::kNotNumeric);
  CHECK(checks::check_numeric_range(nlohmann::json{{"pressure", true}}, range) ==
        RangeCheck::kNotNumeric);
  CHECK(checks::to_string(RangeCheck::kNotNumeric) == "not_numeric");
}
