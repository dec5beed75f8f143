#include "pipeaudit/core/clock.h"
#include "pipeaudit/lease/resource_lease.h"

#include <catch2/catch_test_macros.hpp>

#include "support/pipeline_fixture.h"
#include <atomic>
#include <fstream>
#include <iterator>
#include <memory>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace pipeaudit;
using testing::fixed_now;
using testing::minutes_ago;

namespace {

void write_lease(const std::string& path, const std::string& acquired_at) {
  std::ofstream out(path);
  out << R"({"pid": 4242, "acquired_at": ")" << acquired_at << "\"}\n";
}

}  // namespace

// ── Test 1: pure rules ──────────────────────────────────────────────────────

TEST_CASE("is_lease_stale: strictly older than the threshold", "[lease]") {
  CHECK_FALSE(lease::is_lease_stale(minutes_ago(30), fixed_now(), 55.0));
  CHECK_FALSE(lease::is_lease_stale(minutes_ago(55), fixed_now(), 55.0));
  CHECK(lease::is_lease_stale(minutes_ago(55.5), fixed_now(), 55.0));
}

TEST_CASE("parse_lease_record: pid and timestamp, tolerant of junk", "[lease]") {
  const auto record =
      lease::parse_lease_record(R"({"pid": 4242, "acquired_at": "2026-01-01T11:00:00Z"})");
  CHECK(record.pid == 4242);
  CHECK(record.acquired_at == std::optional<core::Timestamp>(minutes_ago(60)));

  const auto junk = lease::parse_lease_record("4242\n");
  CHECK_FALSE(junk.acquired_at.has_value());

  const auto truncated = lease::parse_lease_record(R"({"pid": 42)");
  CHECK(truncated.pid == 0);
  CHECK_FALSE(truncated.acquired_at.has_value());
}

TEST_CASE("lease_token: pid and acquisition time", "[lease]") {
  CHECK(lease::lease_token(lease::LeaseRecord{4242, fixed_now()}) ==
        "4242@2026-01-01T12:00:00Z");
  CHECK(lease::lease_token(lease::LeaseRecord{4242, std::nullopt}) == "4242@");

  const auto record =
      lease::parse_lease_record(R"({"pid": 4242, "acquired_at": "2026-01-01T12:00:00Z"})");
  CHECK(lease::lease_token(record) == "4242@2026-01-01T12:00:00Z");
}

// ── Test 2: acquisition ─────────────────────────────────────────────────────

TEST_CASE("ResourceLease: acquire creates the file and release removes it", "[lease]") {
  testing::TempDir dir("lease_basic");
  core::FixedClock clock(fixed_now());
  lease::ResourceLease held(dir.file("hourly.lock"), clock);

  auto acquired = held.acquire(55.0);
  REQUIRE(acquired.has_value());
  CHECK(std::holds_alternative<lease::LeaseAcquired>(acquired.value()));
  CHECK(held.held());
  CHECK(held.acquired_at() == std::optional<core::Timestamp>(fixed_now()));
  CHECK(std::filesystem::exists(dir.file("hourly.lock")));

  std::ifstream in(dir.file("hourly.lock"));
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  CHECK(lease::parse_lease_record(body).acquired_at ==
        std::optional<core::Timestamp>(fixed_now()));

  auto released = held.release();
  REQUIRE(released.has_value());
  CHECK(released.value());
  CHECK_FALSE(held.held());
  CHECK_FALSE(std::filesystem::exists(dir.file("hourly.lock")));

  auto again = held.release();
  REQUIRE(again.has_value());
  CHECK_FALSE(again.value());
}

TEST_CASE("ResourceLease: a fresh lease held elsewhere makes the caller skip", "[lease]") {
  testing::TempDir dir("lease_fresh");
  write_lease(dir.file("hourly.lock"), "2026-01-01T11:30:00Z");

  core::FixedClock clock(fixed_now());
  lease::ResourceLease contender(dir.file("hourly.lock"), clock);
  auto outcome = contender.acquire(55.0);
  REQUIRE(outcome.has_value());
  REQUIRE(std::holds_alternative<lease::LeaseHeldByOther>(outcome.value()));
  CHECK(std::get<lease::LeaseHeldByOther>(outcome.value()).age_minutes == 30.0);
  CHECK_FALSE(contender.held());
  CHECK(std::filesystem::exists(dir.file("hourly.lock")));
}

TEST_CASE("ResourceLease: a stale lease is replaced", "[lease]") {
  testing::TempDir dir("lease_stale");
  write_lease(dir.file("hourly.lock"), "2026-01-01T10:00:00Z");

  core::FixedClock clock(fixed_now());
  lease::ResourceLease taker(dir.file("hourly.lock"), clock);
  auto outcome = taker.acquire(55.0);
  REQUIRE(outcome.has_value());
  CHECK(std::holds_alternative<lease::LeaseAcquired>(outcome.value()));
  CHECK(taker.held());
}

TEST_CASE("ResourceLease: destruction releases, detach keeps the file", "[lease]") {
  testing::TempDir dir("lease_scope");
  core::FixedClock clock(fixed_now());

  {
    lease::ResourceLease scoped(dir.file("a.lock"), clock);
    REQUIRE(scoped.acquire(55.0).has_value());
    CHECK(std::filesystem::exists(dir.file("a.lock")));
  }
  CHECK_FALSE(std::filesystem::exists(dir.file("a.lock")));

  {
    lease::ResourceLease handed_over(dir.file("b.lock"), clock);
    REQUIRE(handed_over.acquire(55.0).has_value());
    handed_over.detach();
  }
  CHECK(std::filesystem::exists(dir.file("b.lock")));

}

TEST_CASE("release_lease_file: removes only the lease named by the token", "[lease]") {
  testing::TempDir dir("lease_token_release");
  const std::string path = dir.file("b.lock");
  core::FixedClock clock(fixed_now());

  std::string token;
  {
    lease::ResourceLease handed_over(path, clock);
    REQUIRE(handed_over.acquire(55.0).has_value());
    token = handed_over.token();
    handed_over.detach();
  }
  CHECK(token == std::to_string(::getpid()) + "@2026-01-01T12:00:00Z");

  auto wrong = lease::ResourceLease::release_lease_file(path, "1@2026-01-01T12:00:00Z");
  REQUIRE(wrong.has_value());
  CHECK(wrong.value() == lease::ReleaseOutcome::kHeldByOther);
  CHECK(std::filesystem::exists(path));

  auto removed = lease::ResourceLease::release_lease_file(path, token);
  REQUIRE(removed.has_value());
  CHECK(removed.value() == lease::ReleaseOutcome::kReleased);
  CHECK_FALSE(std::filesystem::exists(path));

  auto absent = lease::ResourceLease::release_lease_file(path, token);
  REQUIRE(absent.has_value());
  CHECK(absent.value() == lease::ReleaseOutcome::kAbsent);
}

TEST_CASE("ResourceLease: a holder whose lease was taken over does not remove it", "[lease]") {
  testing::TempDir dir("lease_takeover");
  const std::string path = dir.file("hourly.lock");
  core::FixedClock first_clock(fixed_now());
  core::FixedClock second_clock(testing::minutes_ago(-56));

  lease::ResourceLease first(path, first_clock);
  REQUIRE(first.acquire(55.0).has_value());
  REQUIRE(first.held());

  lease::ResourceLease second(path, second_clock);
  auto taken = second.acquire(55.0);
  REQUIRE(taken.has_value());
  REQUIRE(std::holds_alternative<lease::LeaseAcquired>(taken.value()));
  CHECK(second.token() != first.token());

  auto late = first.release();
  REQUIRE(late.has_value());
  CHECK_FALSE(late.value());
  CHECK_FALSE(first.held());
  CHECK(std::filesystem::exists(path));

  auto released = second.release();
  REQUIRE(released.has_value());
  CHECK(released.value());
  CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("ResourceLease: contenders for a stale lease get exactly one winner", "[lease]") {
  testing::TempDir dir("lease_contention");
  const std::string path = dir.file("hourly.lock");
  constexpr int kRounds = 20;
  constexpr int kContenders = 8;

  for (int round = 0; round < kRounds; ++round) {
    write_lease(path, "2026-01-01T10:00:00Z");

    std::vector<std::unique_ptr<core::FixedClock>> clocks;
    std::vector<std::unique_ptr<lease::ResourceLease>> leases;
    for (int i = 0; i < kContenders; ++i) {
      clocks.push_back(std::make_unique<core::FixedClock>(fixed_now()));
      leases.push_back(std::make_unique<lease::ResourceLease>(path, *clocks.back()));
    }

    std::atomic<int> acquired{0};
    std::atomic<int> held_elsewhere{0};
    std::atomic<int> failed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kContenders; ++i) {
      threads.emplace_back([&, i] {
        auto outcome = leases[static_cast<std::size_t>(i)]->acquire(55.0);
        if (!outcome.has_value()) {
          ++failed;
        } else if (std::holds_alternative<lease::LeaseAcquired>(outcome.value())) {
          ++acquired;
        } else {
          ++held_elsewhere;
        }
      });
    }
    for (auto& t : threads) {
      t.join();
    }

    INFO("round " << round);
    CHECK(failed.load() == 0);
    CHECK(acquired.load() == 1);
    CHECK(held_elsewhere.load() == kContenders - 1);

    for (auto& held : leases) {
      if (held->held()) {
        auto released = held->release();
        REQUIRE(released.has_value());
        CHECK(released.value());
      }
    }
    CHECK_FALSE(std::filesystem::exists(path));
  }
}

TEST_CASE("ResourceLease: unwritable location is an error", "[lease]") {
  testing::TempDir dir("lease_error");
  core::FixedClock clock(fixed_now());
  lease::ResourceLease nowhere(dir.file("missing_dir/a.lock"), clock);

  auto outcome = nowhere.acquire(55.0);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().find("cannot create lease") != std::string::npos);
}
