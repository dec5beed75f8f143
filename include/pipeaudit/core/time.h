#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pipeaudit::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_seconds(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_seconds(const std::int64_t seconds) {
  return Timestamp{std::chrono::seconds{seconds}};
}

// Elapsed minutes between two instants on the UTC epoch timeline.
// Negative spans (mtime in the future) are clamped to zero.
inline double age_minutes(const Timestamp from, const Timestamp now) {
  const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - from).count();
  if (delta <= 0) {
    return 0.0;
  }
  return static_cast<double>(delta) / 60000.0;
}

// format_iso8601_utc renders "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_iso8601_utc(Timestamp ts);

// format_file_stamp_utc renders "YYYYMMDD_HHMMSSZ" for artifact file names.
[[nodiscard]] std::string format_file_stamp_utc(Timestamp ts);

// parse_iso8601_utc accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part
// and an optional "Z" or "+00:00" suffix (a space is accepted in place of 'T').
// Offsets other than UTC are rejected.
[[nodiscard]] std::optional<Timestamp> parse_iso8601_utc(std::string_view text);

// Round to one decimal for human-facing age values.
[[nodiscard]] double round_tenth(double value);

}  // namespace pipeaudit::core
