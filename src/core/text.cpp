#include "pipeaudit/core/text.h"

namespace pipeaudit::core {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;

  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }

    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }

  return lines;
}

std::string last_non_empty_line(std::string_view text) {
  const auto tail = tail_lines(text, 1);
  return tail.empty() ? std::string{} : tail.front();
}

std::vector<std::string> tail_lines(std::string_view text, std::size_t count) {
  if (count == 0) {
    return {};
  }

  std::vector<std::string> kept;
  for (auto& line : split_lines(text)) {
    if (!trim(line).empty()) {
      kept.push_back(std::move(line));
    }
  }

  if (kept.size() > count) {
    kept.erase(kept.begin(), kept.end() - static_cast<std::ptrdiff_t>(count));
  }
  return kept;
}

std::vector<std::string> split_csv_line(std::string_view line) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(ch);
      }
    } else if (ch == '"') {
      in_quotes = true;
    } else if (ch == ',') {
      fields.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }

  fields.push_back(trim(current));
  return fields;
}

std::string join(const std::vector<std::string>& items, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(items[i]);
  }
  return out;
}

std::string truncate_head(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return std::string{text};
  }
  std::size_t end = max_bytes;
  while (end > 0 && is_utf8_continuation(text[end])) {
    --end;
  }
  return std::string{text.substr(0, end)} + "...";
}

std::string truncate_tail(std::string_view text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return std::string{text};
  }
  std::size_t start = text.size() - max_bytes;
  while (start < text.size() && is_utf8_continuation(text[start])) {
    ++start;
  }
  return "..." + std::string{text.substr(start)};
}

}  // namespace pipeaudit::core
