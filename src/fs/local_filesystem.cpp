#include "pipeaudit/fs/local_filesystem.h"

#include <sys/stat.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace pipeaudit::fs {

std::string join_path(const std::string& root, const std::string& relative) {
  if (root.empty()) {
    return relative;
  }
  if (relative.empty()) {
    return root;
  }

  std::string out = root;
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  std::size_t start = 0;
  while (start < relative.size() && relative[start] == '/') {
    ++start;
  }
  if (out != "/") {
    out.push_back('/');
  }
  out.append(relative, start, std::string::npos);
  return out;
}

bool LocalFileSystem::exists(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

bool LocalFileSystem::is_directory(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::is_directory(path, ec) && !ec;
}

std::optional<core::Timestamp> LocalFileSystem::last_modified(const std::string& path) const {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  const auto since_epoch = std::chrono::seconds{st.st_mtim.tv_sec} +
                           std::chrono::nanoseconds{st.st_mtim.tv_nsec};
  return core::Timestamp{std::chrono::duration_cast<core::Clock::duration>(since_epoch)};
}

std::optional<std::string> LocalFileSystem::read_text(const std::string& path) const {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return oss.str();
}

std::vector<DirEntry> LocalFileSystem::list_directory(const std::string& path) const {
  std::vector<DirEntry> entries;

  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return entries;
  }

  // An error while advancing ends the listing with the entries read so far.
  const std::filesystem::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto& entry = *it;
    const auto mtime = last_modified(entry.path().string());
    if (!mtime.has_value()) {
      continue;  // vanished between listing and stat
    }
    std::error_code kind_ec;
    entries.push_back(DirEntry{entry.path().filename().string(),
                               entry.is_directory(kind_ec) && !kind_ec, mtime.value()});
  }

  std::sort(entries.begin(), entries.end(),
            [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
  return entries;
}

}  // namespace pipeaudit::fs
