#include "pipeaudit/checks/schema_validator.h"

#include "pipeaudit/core/text.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <set>

namespace pipeaudit::checks {

namespace {

constexpr std::size_t kMaxParseMessageChars = 160;

std::vector<std::string> sorted_unique(std::vector<std::string> items) {
  std::sort(items.begin(), items.end());
  items.erase(std::unique(items.begin(), items.end()), items.end());
  return items;
}

}  // namespace

core::Result<nlohmann::json, std::string> parse_json_document(const std::string_view text) {
  using R = core::Result<nlohmann::json, std::string>;

  const std::string trimmed = core::trim(text);
  if (trimmed.empty()) {
    return R::err("empty document");
  }

  try {
    auto doc = nlohmann::json::parse(trimmed);
    if (!doc.is_object()) {
      return R::err("expected a JSON object");
    }
    return R::ok(std::move(doc));
  } catch (const nlohmann::json::parse_error& e) {
    std::string message = e.what();
    if (message.size() > kMaxParseMessageChars) {
      message.resize(kMaxParseMessageChars);
    }
    return R::err(message);
  }
}

core::Result<std::vector<std::string>, std::string> parse_csv_first_row(
    const std::string_view text) {
  using R = core::Result<std::vector<std::string>, std::string>;

  for (const auto& line : core::split_lines(text)) {
    const std::string trimmed = core::trim(line);
    if (trimmed.empty()) {
      continue;
    }
    return R::ok(core::split_csv_line(trimmed));
  }
  return R::err("empty document");
}

std::optional<double> parse_numeric_text(const std::string_view text) {
  const std::string trimmed = core::trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const char* begin = trimmed.c_str();
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

const nlohmann::json* find_path(const nlohmann::json& doc, const std::string_view path) {
  const nlohmann::json* node = &doc;
  std::size_t start = 0;
  while (start <= path.size()) {
    const auto dot = path.find('.', start);
    const auto segment =
        std::string(path.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                     : dot - start));
    if (!node->is_object()) {
      return nullptr;
    }
    auto it = node->find(segment);
    if (it == node->end()) {
      return nullptr;
    }
    node = &(*it);
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  return node;
}

std::vector<std::string> missing_keys(const nlohmann::json& doc,
                                      const std::vector<std::string>& required) {
  std::vector<std::string> missing;
  for (const auto& key : required) {
    if (find_path(doc, key) == nullptr) {
      missing.push_back(key);
    }
  }
  return sorted_unique(std::move(missing));
}

std::vector<std::string> missing_columns(const std::vector<std::string>& row,
                                         const std::vector<std::string>& required) {
  const std::set<std::string> present(row.begin(), row.end());
  std::vector<std::string> missing;
  for (const auto& column : required) {
    if (present.find(column) == present.end()) {
      missing.push_back(column);
    }
  }
  return sorted_unique(std::move(missing));
}

std::string format_missing_keys(const std::vector<std::string>& keys) {
  return "missing keys: " + core::join(keys, ", ");
}

RangeCheck check_numeric_range(const nlohmann::json& doc, const audit::NumericRange& range) {
  const nlohmann::json* value = find_path(doc, range.key);
  if (value == nullptr || value->is_null()) {
    return RangeCheck::kAbsent;
  }
  if (!value->is_number()) {
    return RangeCheck::kNotNumeric;
  }
  const double v = value->get<double>();
  if (!std::isfinite(v)) {
    return RangeCheck::kNotNumeric;
  }
  if (v < range.min || v > range.max) {
    return RangeCheck::kOutOfRange;
  }
  return RangeCheck::kInRange;
}

std::string_view to_string(const RangeCheck check) noexcept {
  switch (check) {
    case RangeCheck::kInRange:
      return "in_range";
    case RangeCheck::kOutOfRange:
      return "out_of_range";
    case RangeCheck::kNotNumeric:
      return "not_numeric";
    case RangeCheck::kAbsent:
      return "absent";
  }
  return "absent";
}

}  // namespace pipeaudit::checks
