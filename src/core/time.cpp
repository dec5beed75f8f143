#include "pipeaudit/core/time.h"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pipeaudit::core {

namespace {

std::tm to_utc_tm(const Timestamp ts) {
  const std::time_t t = Clock::to_time_t(ts);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

}  // namespace

std::string format_iso8601_utc(const Timestamp ts) {
  const std::tm tm = to_utc_tm(ts);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string format_file_stamp_utc(const Timestamp ts) {
  const std::tm tm = to_utc_tm(ts);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%SZ");
  return oss.str();
}

std::optional<Timestamp> parse_iso8601_utc(std::string_view text) {
  // Minimum: "YYYY-MM-DDTHH:MM:SS"
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::string head{text.substr(0, 19)};
  if (head[10] == ' ') {
    head[10] = 'T';
  }

  std::tm tm{};
  std::istringstream iss(head);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  std::string_view rest = text.substr(19);

  // Fractional seconds are dropped.
  if (!rest.empty() && rest.front() == '.') {
    std::size_t i = 1;
    while (i < rest.size() && rest[i] >= '0' && rest[i] <= '9') {
      ++i;
    }
    if (i == 1) {
      return std::nullopt;
    }
    rest = rest.substr(i);
  }

  if (!rest.empty() && rest != "Z" && rest != "+00:00" && rest != "+0000") {
    return std::nullopt;
  }

  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Clock::from_time_t(seconds);
}

double round_tenth(const double value) {
  return std::round(value * 10.0) / 10.0;
}

}  // namespace pipeaudit::core
