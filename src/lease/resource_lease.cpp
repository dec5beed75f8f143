#include "pipeaudit/lease/resource_lease.h"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace pipeaudit::lease {

namespace {

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

std::optional<core::Timestamp> file_mtime(const std::string& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return core::from_unix_seconds(st.st_mtim.tv_sec);
}

// The lease file as found on disk. Absent when there is no file.
std::optional<LeaseRecord> read_lease(const std::string& path) {
  const auto text = read_file(path);
  if (!text.has_value()) {
    return std::nullopt;
  }
  return parse_lease_record(text.value());
}

// Acquisition time of an existing lease, from its record or else its mtime.
std::optional<core::Timestamp> lease_acquired_at(const std::string& path,
                                                 const LeaseRecord& record) {
  if (record.acquired_at.has_value()) {
    return record.acquired_at;
  }
  return file_mtime(path);
}

// LeaseGuard holds an exclusive flock on "<lease>.guard" for its lifetime.
class LeaseGuard {
 public:
  explicit LeaseGuard(const std::string& lease_path) {
    const std::string guard_path = lease_path + ".guard";
    fd_ = ::open(guard_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      error_ = "cannot create lease guard " + guard_path + ": " + std::strerror(errno);
      return;
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno != EINTR) {
        error_ = "cannot lock lease guard " + guard_path + ": " + std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return;
      }
    }
  }

  ~LeaseGuard() {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }

  LeaseGuard(const LeaseGuard&) = delete;
  LeaseGuard& operator=(const LeaseGuard&) = delete;
  LeaseGuard(LeaseGuard&&) = delete;
  LeaseGuard& operator=(LeaseGuard&&) = delete;

  [[nodiscard]] const std::string& error() const { return error_; }

 private:
  int fd_{-1};
  std::string error_;
};

}  // namespace

std::string lease_token(const LeaseRecord& record) {
  return std::to_string(record.pid) + "@" +
         (record.acquired_at.has_value() ? core::format_iso8601_utc(record.acquired_at.value())
                                         : std::string{});
}

bool is_lease_stale(const core::Timestamp acquired_at, const core::Timestamp now,
                    const double max_age_minutes) {
  return core::age_minutes(acquired_at, now) > max_age_minutes;
}

LeaseRecord parse_lease_record(const std::string& text) {
  LeaseRecord record;
  try {
    const auto doc = nlohmann::json::parse(text);
    if (!doc.is_object()) {
      return record;
    }
    if (auto it = doc.find("pid"); it != doc.end() && it->is_number_integer()) {
      record.pid = it->get<long>();
    }
    if (auto it = doc.find("acquired_at"); it != doc.end() && it->is_string()) {
      record.acquired_at = core::parse_iso8601_utc(it->get<std::string>());
    }
  } catch (const nlohmann::json::parse_error&) {
    // Legacy or truncated lease files fall back to the file mtime.
    return record;
  }
  return record;
}

ResourceLease::ResourceLease(std::string path, core::IClock& clock)
    : path_(std::move(path)), clock_(clock) {}

ResourceLease::~ResourceLease() {
  if (held_) {
    // A lease that cannot be removed here goes stale.
    static_cast<void>(release_lease_file(path_, token_));
  }
}

core::Result<bool, std::string> ResourceLease::try_create(const core::Timestamp now) {
  const int fd = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      return core::Result<bool, std::string>::ok(false);
    }
    return core::Result<bool, std::string>::err("cannot create lease " + path_ + ": " +
                                                std::strerror(errno));
  }

  const LeaseRecord record{static_cast<long>(::getpid()), now};
  const nlohmann::json doc = {{"pid", record.pid},
                              {"acquired_at", core::format_iso8601_utc(now)}};
  const std::string body = doc.dump() + "\n";
  const ssize_t written = ::write(fd, body.data(), body.size());
  const int write_errno = errno;
  ::close(fd);
  if (written != static_cast<ssize_t>(body.size())) {
    ::unlink(path_.c_str());
    return core::Result<bool, std::string>::err("cannot write lease " + path_ + ": " +
                                                std::strerror(write_errno));
  }

  held_ = true;
  acquired_at_ = now;
  token_ = lease_token(record);
  return core::Result<bool, std::string>::ok(true);
}

core::Result<AcquireOutcome, std::string> ResourceLease::acquire(const double max_age_minutes) {
  using R = core::Result<AcquireOutcome, std::string>;

  stale_after_minutes_ = max_age_minutes;
  if (held_) {
    return R::ok(LeaseAcquired{});
  }

  const LeaseGuard guard(path_);
  if (!guard.error().empty()) {
    return R::err(guard.error());
  }

  const core::Timestamp now = clock_.now();
  auto created = try_create(now);
  if (!created.has_value()) {
    return R::err(created.error());
  }
  if (created.value()) {
    return R::ok(LeaseAcquired{});
  }

  // An existing lease; under the guard it cannot change until we are done.
  const auto existing = read_lease(path_);
  const auto existing_at =
      existing.has_value() ? lease_acquired_at(path_, existing.value()) : std::nullopt;
  if (existing_at.has_value() && !is_lease_stale(existing_at.value(), now, max_age_minutes)) {
    return R::ok(LeaseHeldByOther{core::age_minutes(existing_at.value(), now)});
  }

  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    return R::err("cannot replace stale lease " + path_ + ": " + std::strerror(errno));
  }
  created = try_create(now);
  if (!created.has_value()) {
    return R::err(created.error());
  }
  if (!created.value()) {
    // Re-created by a process that does not take the guard.
    return R::ok(LeaseHeldByOther{0.0});
  }
  return R::ok(LeaseAcquired{});
}

core::Result<bool, std::string> ResourceLease::release() {
  if (!held_) {
    return core::Result<bool, std::string>::ok(false);
  }
  held_ = false;
  acquired_at_.reset();

  auto released = release_lease_file(path_, token_);
  if (!released.has_value()) {
    return core::Result<bool, std::string>::err(released.error());
  }
  return core::Result<bool, std::string>::ok(released.value() == ReleaseOutcome::kReleased);
}

core::Result<ReleaseOutcome, std::string> ResourceLease::release_lease_file(
    const std::string& path, const std::string& token) {
  using R = core::Result<ReleaseOutcome, std::string>;

  const LeaseGuard guard(path);
  if (!guard.error().empty()) {
    return R::err(guard.error());
  }

  const auto existing = read_lease(path);
  if (!existing.has_value()) {
    return R::ok(ReleaseOutcome::kAbsent);
  }
  if (lease_token(existing.value()) != token) {
    return R::ok(ReleaseOutcome::kHeldByOther);
  }

  if (::unlink(path.c_str()) != 0) {
    if (errno == ENOENT) {
      return R::ok(ReleaseOutcome::kAbsent);
    }
    return R::err("cannot remove lease " + path + ": " + std::strerror(errno));
  }
  return R::ok(ReleaseOutcome::kReleased);
}

}  // namespace pipeaudit::lease
