#pragma once

#include "pipeaudit/core/time.h"

#include <string>

namespace pipeaudit::core {

// Abstract clock interface for timestamp injection.
// Production code reads system time; tests pin "now" so that ages and
// produced_at stamps are reproducible.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current instant on the UTC epoch timeline.
  virtual Timestamp now() = 0;

  // Current instant rendered as ISO 8601 (UTC, second precision).
  std::string now_iso8601() { return format_iso8601_utc(now()); }

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
};

// Fixed clock: returns a constant instant for deterministic tests and replays.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(Timestamp fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  Timestamp now() override;

  void set(Timestamp fixed_time) { fixed_time_ = fixed_time; }

 private:
  Timestamp fixed_time_;
};

}  // namespace pipeaudit::core
