#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeaudit::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is rejected; a rejected value
// is recorded as a parse error and the remaining flags are still processed.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Unknown flags, missing values and rejected values are collected in errors,
// in argument order. Non-flag tokens are ignored.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      opt->handler(parsed.config, "");
      continue;
    }
    if (i + 1 >= argc) {
      parsed.errors.push_back("Option " + arg + " requires a value");
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid " + arg + ": '" + value + "'");
    }
  }

  return parsed;
}

// print_usage lists the flags of a subcommand, one per line.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    if (flag.size() < 32) {
      flag.append(32 - flag.size(), ' ');
    }
    out << "  " << flag << opt.description << "\n";
  }
}

// parse_count accepts a non-negative decimal integer.
inline std::optional<std::size_t> parse_count(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::size_t out = 0;
  for (const char c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const std::size_t digit = static_cast<std::size_t>(c - '0');
    if (out > (static_cast<std::size_t>(-1) - digit) / 10) {
      return std::nullopt;
    }
    out = out * 10 + digit;
  }
  return out;
}

// parse_minutes accepts a finite, strictly positive decimal number.
inline std::optional<double> parse_minutes(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  std::size_t consumed = 0;
  double out = 0.0;
  try {
    out = std::stod(value, &consumed);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  if (consumed != value.size() || !(out > 0.0) || out > 1e12) {
    return std::nullopt;
  }
  return out;
}

}  // namespace pipeaudit::apps
