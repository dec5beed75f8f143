#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pipeaudit::core {

// Deterministic ASCII-only text utilities.
// Locale-independent so that findings are byte-stable across hosts.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// contains_ascii_ci reports whether needle occurs in haystack ignoring ASCII case.
inline bool contains_ascii_ci(const std::string_view haystack, const std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return normalize_ascii_lower(haystack).find(normalize_ascii_lower(needle)) != std::string::npos;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline).
// A leading UTF-8 byte order mark is dropped as well.
inline std::string trim(std::string_view input) {
  if (input.size() >= 3 && input.substr(0, 3) == "\xEF\xBB\xBF") {
    input.remove_prefix(3);
  }

  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// split_lines splits on '\n' and strips a trailing '\r' from each line.
// A trailing newline does not produce a final empty line.
std::vector<std::string> split_lines(std::string_view text);

// last_non_empty_line returns the final line that is not blank, or "" when none exists.
std::string last_non_empty_line(std::string_view text);

// tail_lines returns up to `count` trailing non-blank lines in file order.
std::vector<std::string> tail_lines(std::string_view text, std::size_t count);

// split_csv_line splits one CSV record on commas, honouring double-quoted fields
// ("" inside quotes is an escaped quote). Fields are trimmed.
std::vector<std::string> split_csv_line(std::string_view line);

// join concatenates items with a separator.
std::string join(const std::vector<std::string>& items, std::string_view separator);

// is_utf8_continuation reports whether ch is a 10xxxxxx trailing byte.
inline bool is_utf8_continuation(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U;
}

// truncate_head keeps at most max_bytes leading bytes of text, followed by "..."
// when something was cut. The cut never splits a UTF-8 sequence.
std::string truncate_head(std::string_view text, std::size_t max_bytes);

// truncate_tail keeps at most max_bytes trailing bytes of text, prefixed with "..."
// when something was cut. The cut never splits a UTF-8 sequence.
std::string truncate_tail(std::string_view text, std::size_t max_bytes);

}  // namespace pipeaudit::core
