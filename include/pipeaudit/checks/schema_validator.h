#pragma once

#include "pipeaudit/audit/resource.h"
#include "pipeaudit/core/result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeaudit::checks {

// ────────────────────────────────────────────────────────────────────────────
// Document parsing
// ────────────────────────────────────────────────────────────────────────────

// parse_json_document parses text that must hold one JSON object.
// Errors carry the parser message; a non-object top-level value is an error too.
[[nodiscard]] core::Result<nlohmann::json, std::string> parse_json_document(
    std::string_view text);

// parse_csv_first_row returns the fields of the first non-blank line.
// An empty document is an error.
[[nodiscard]] core::Result<std::vector<std::string>, std::string> parse_csv_first_row(
    std::string_view text);

// parse_numeric_text reads a single finite number from free text (surrounding
// whitespace allowed). Returns std::nullopt for anything else ("N/A", "", "1.2x").
[[nodiscard]] std::optional<double> parse_numeric_text(std::string_view text);

// ────────────────────────────────────────────────────────────────────────────
// Key presence and range rules
// ────────────────────────────────────────────────────────────────────────────

// find_path resolves a dotted key path ("components.vol_ratio") through nested objects.
// Returns nullptr when any segment is absent or a non-object is traversed.
[[nodiscard]] const nlohmann::json* find_path(const nlohmann::json& doc, std::string_view path);

// missing_keys returns every required path absent from doc, sorted and de-duplicated.
[[nodiscard]] std::vector<std::string> missing_keys(const nlohmann::json& doc,
                                                    const std::vector<std::string>& required);

// missing_columns returns every required column absent from a header row, sorted and
// de-duplicated. Column order in the row is irrelevant.
[[nodiscard]] std::vector<std::string> missing_columns(const std::vector<std::string>& row,
                                                       const std::vector<std::string>& required);

// format_missing_keys renders "missing keys: a, b".
[[nodiscard]] std::string format_missing_keys(const std::vector<std::string>& keys);

enum class RangeCheck {
  kInRange,
  kOutOfRange,
  kNotNumeric,
  kAbsent,
};

// check_numeric_range tests doc[range.key] against the closed interval [min, max].
[[nodiscard]] RangeCheck check_numeric_range(const nlohmann::json& doc,
                                             const audit::NumericRange& range);

[[nodiscard]] std::string_view to_string(RangeCheck check) noexcept;

}  // namespace pipeaudit::checks
