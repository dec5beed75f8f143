#include "pipeaudit/fs/inmemory_filesystem.h"
#include "pipeaudit/fs/local_filesystem.h"

#include <catch2/catch_test_macros.hpp>

#include "support/pipeline_fixture.h"
#include <filesystem>
#include <fstream>
#include <vector>

using namespace pipeaudit;
using testing::minutes_ago;

TEST_CASE("join_path: collapses duplicate separators", "[fs]") {
  CHECK(fs::join_path("/pipe", "data/x.json") == "/pipe/data/x.json");
  CHECK(fs::join_path("/pipe/", "/data") == "/pipe/data");
  CHECK(fs::join_path("", "data") == "data");
  CHECK(fs::join_path("/pipe", "") == "/pipe");
}

// ── InMemoryFileSystem ──────────────────────────────────────────────────────

TEST_CASE("InMemoryFileSystem: files create their parent directories", "[fs][inmemory]") {
  fs::InMemoryFileSystem mem;
  mem.add_file("/pipe/data/flows.json", "{}", minutes_ago(5));

  CHECK(mem.exists("/pipe/data/flows.json"));
  CHECK_FALSE(mem.is_directory("/pipe/data/flows.json"));
  CHECK(mem.is_directory("/pipe/data"));
  CHECK(mem.is_directory("/pipe/data/"));
  CHECK(mem.read_text("/pipe/data/flows.json") == std::optional<std::string>("{}"));
  CHECK(mem.last_modified("/pipe/data/flows.json") == minutes_ago(5));
  CHECK_FALSE(mem.read_text("/pipe/data").has_value());
  CHECK_FALSE(mem.last_modified("/pipe/nothing").has_value());
}

TEST_CASE("InMemoryFileSystem: list_directory returns direct children sorted",
          "[fs][inmemory]") {
  fs::InMemoryFileSystem mem;
  mem.add_directory("/pipe/reports/daily/2025-12-31", minutes_ago(60));
  mem.add_directory("/pipe/reports/daily/2025-12-30", minutes_ago(120));
  mem.add_file("/pipe/reports/daily/index.txt", "x", minutes_ago(1));
  mem.add_file("/pipe/reports/daily/2025-12-31/summary.md", "x", minutes_ago(60));

  const auto entries = mem.list_directory("/pipe/reports/daily");
  REQUIRE(entries.size() == 3);
  CHECK(entries[0].name == "2025-12-30");
  CHECK(entries[0].is_directory);
  CHECK(entries[1].name == "2025-12-31");
  CHECK(entries[2].name == "index.txt");
  CHECK_FALSE(entries[2].is_directory);
}

TEST_CASE("InMemoryFileSystem: remove drops the subtree", "[fs][inmemory]") {
  fs::InMemoryFileSystem mem;
  testing::populate_healthy_tree(mem);
  mem.remove(testing::at_root("logs"));

  CHECK_FALSE(mem.exists(testing::at_root("logs")));
  CHECK_FALSE(mem.exists(testing::at_root("logs/engine_heartbeat.txt")));
  CHECK(mem.exists(testing::at_root("data")));
}

// ── LocalFileSystem ─────────────────────────────────────────────────────────

TEST_CASE("LocalFileSystem: reads files, mtimes and listings", "[fs][local]") {
  testing::TempDir dir("localfs");
  std::filesystem::create_directories(dir.file("agents"));
  {
    std::ofstream out(dir.file("agents/BTC_A.json"));
    out << R"({"phase_vector": []})";
  }

  fs::LocalFileSystem local;
  CHECK(local.exists(dir.file("agents/BTC_A.json")));
  CHECK(local.is_directory(dir.file("agents")));
  CHECK_FALSE(local.is_directory(dir.file("agents/BTC_A.json")));
  CHECK(local.read_text(dir.file("agents/BTC_A.json")) ==
        std::optional<std::string>(R"({"phase_vector": []})"));

  const auto mtime = local.last_modified(dir.file("agents/BTC_A.json"));
  REQUIRE(mtime.has_value());
  CHECK(core::age_minutes(mtime.value(), core::now_utc()) < 5.0);

  const auto entries = local.list_directory(dir.path());
  REQUIRE(entries.size() == 1);
  CHECK(entries[0].name == "agents");
  CHECK(entries[0].is_directory);
}

TEST_CASE("LocalFileSystem: absent paths are reported, never thrown", "[fs][local]") {
  testing::TempDir dir("localfs_absent");
  fs::LocalFileSystem local;

  CHECK_FALSE(local.exists(dir.file("missing.json")));
  CHECK_FALSE(local.last_modified(dir.file("missing.json")).has_value());
  CHECK_FALSE(local.read_text(dir.file("missing.json")).has_value());
  CHECK(local.list_directory(dir.file("missing")).empty());
}

TEST_CASE("LocalFileSystem: listing skips entries that cannot be stat'ed", "[fs][local]") {
  testing::TempDir dir("localfs_dangling");
  for (int i = 0; i < 50; ++i) {
    std::ofstream(dir.file("run_" + std::to_string(i) + ".csv")) << "x";
  }
  std::filesystem::create_symlink(dir.file("gone"), dir.file("dangling"));

  fs::LocalFileSystem local;
  std::vector<fs::DirEntry> entries;
  CHECK_NOTHROW(entries = local.list_directory(dir.path()));
  CHECK(entries.size() == 50);
  for (const auto& entry : entries) {
    CHECK(entry.name != "dangling");
  }
}
