#pragma once

#include "pipeaudit/core/clock.h"
#include "pipeaudit/core/result.h"

#include <optional>
#include <string>
#include <variant>

namespace pipeaudit::lease {

inline constexpr double kDefaultStaleAfterMinutes = 55.0;

struct LeaseAcquired {};

struct LeaseHeldByOther {
  double age_minutes{0.0};
};

using AcquireOutcome = std::variant<LeaseAcquired, LeaseHeldByOther>;

// Contents of a lease file.
struct LeaseRecord {
  long pid{0};
  std::optional<core::Timestamp> acquired_at;
};

// lease_token identifies one acquisition: "<pid>@<acquired_at ISO 8601>".
// A runner keeps the token from acquire and presents it on release.
[[nodiscard]] std::string lease_token(const LeaseRecord& record);

enum class ReleaseOutcome {
  kReleased,     // NOLINT(readability-identifier-naming)
  kAbsent,       // NOLINT(readability-identifier-naming)
  kHeldByOther,  // NOLINT(readability-identifier-naming)
};

// is_lease_stale reports whether a lease taken at `acquired_at` may be replaced at `now`.
// A lease exactly max_age_minutes old is still valid.
[[nodiscard]] bool is_lease_stale(core::Timestamp acquired_at, core::Timestamp now,
                                  double max_age_minutes);

// parse_lease_record reads {"pid": n, "acquired_at": "<ISO 8601>"}; unknown or
// malformed content yields a record without acquired_at.
[[nodiscard]] LeaseRecord parse_lease_record(const std::string& text);

// ResourceLease is a file-based, time-bounded mutual-exclusion marker shared by pipeline
// runners. Acquisition creates the file atomically (O_CREAT|O_EXCL); an existing lease
// older than the staleness threshold is replaced, a fresh one makes the caller skip.
//
// Inspecting and replacing a lease, and removing one, happen under an exclusive flock
// on "<path>.guard", so two contenders never both replace the same stale lease and a
// release never removes a lease acquired by someone else. The guard file is left in
// place.
//
// The lease is released on destruction while held.
class ResourceLease {
 public:
  ResourceLease(std::string path, core::IClock& clock);
  ~ResourceLease();

  ResourceLease(const ResourceLease&) = delete;
  ResourceLease& operator=(const ResourceLease&) = delete;
  ResourceLease(ResourceLease&&) = delete;
  ResourceLease& operator=(ResourceLease&&) = delete;

  [[nodiscard]] core::Result<AcquireOutcome, std::string> acquire(double max_age_minutes);

  // Removes the lease file if this instance holds it and the file still records this
  // acquisition. Returns false when not held, or when the lease was taken over after
  // going stale (the new holder's file is kept).
  [[nodiscard]] core::Result<bool, std::string> release();

  // Hands the lease over to a later process: the file stays after destruction.
  void detach() { held_ = false; }

  [[nodiscard]] bool held() const { return held_; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] std::optional<core::Timestamp> acquired_at() const { return acquired_at_; }
  [[nodiscard]] double stale_after_minutes() const { return stale_after_minutes_; }

  // Token of the current acquisition; empty when never acquired.
  [[nodiscard]] const std::string& token() const { return token_; }

  // release_lease_file removes the lease at path on behalf of the holder of token (e.g.
  // the runner that acquired it in an earlier CLI invocation). A lease whose record
  // does not match token is left alone.
  [[nodiscard]] static core::Result<ReleaseOutcome, std::string> release_lease_file(
      const std::string& path, const std::string& token);

 private:
  // Returns true on success, false when the file already exists.
  [[nodiscard]] core::Result<bool, std::string> try_create(core::Timestamp now);

  std::string path_;
  core::IClock& clock_;
  bool held_{false};
  std::optional<core::Timestamp> acquired_at_;
  std::string token_;
  double stale_after_minutes_{kDefaultStaleAfterMinutes};
};

}  // namespace pipeaudit::lease
