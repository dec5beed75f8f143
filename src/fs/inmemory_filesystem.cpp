#include "pipeaudit/fs/inmemory_filesystem.h"

namespace pipeaudit::fs {

namespace {

std::string normalize(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path;
}

std::string parent_of(const std::string& path) {
  const auto pos = path.find_last_of('/');
  if (pos == std::string::npos) {
    return "";
  }
  if (pos == 0) {
    return "/";
  }
  return path.substr(0, pos);
}

}  // namespace

void InMemoryFileSystem::ensure_parents(const std::string& path, core::Timestamp mtime) {
  std::string parent = parent_of(path);
  while (!parent.empty() && parent != "/" && nodes_.find(parent) == nodes_.end()) {
    nodes_[parent] = Node{true, "", mtime};
    parent = parent_of(parent);
  }
}

void InMemoryFileSystem::add_directory(const std::string& path, core::Timestamp mtime) {
  const std::string key = normalize(path);
  ensure_parents(key, mtime);
  nodes_[key] = Node{true, "", mtime};
}

void InMemoryFileSystem::add_file(const std::string& path, std::string content,
                                  core::Timestamp mtime) {
  const std::string key = normalize(path);
  ensure_parents(key, mtime);
  nodes_[key] = Node{false, std::move(content), mtime};
}

void InMemoryFileSystem::set_last_modified(const std::string& path, core::Timestamp mtime) {
  auto it = nodes_.find(normalize(path));
  if (it != nodes_.end()) {
    it->second.mtime = mtime;
  }
}

void InMemoryFileSystem::remove(const std::string& path) {
  const std::string key = normalize(path);
  const std::string prefix = key + "/";
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    if (it->first == key || it->first.starts_with(prefix)) {
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
}

bool InMemoryFileSystem::exists(const std::string& path) const {
  return nodes_.find(normalize(path)) != nodes_.end();
}

bool InMemoryFileSystem::is_directory(const std::string& path) const {
  auto it = nodes_.find(normalize(path));
  return it != nodes_.end() && it->second.is_directory;
}

std::optional<core::Timestamp> InMemoryFileSystem::last_modified(const std::string& path) const {
  auto it = nodes_.find(normalize(path));
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second.mtime;
}

std::optional<std::string> InMemoryFileSystem::read_text(const std::string& path) const {
  auto it = nodes_.find(normalize(path));
  if (it == nodes_.end() || it->second.is_directory) {
    return std::nullopt;
  }
  return it->second.content;
}

std::vector<DirEntry> InMemoryFileSystem::list_directory(const std::string& path) const {
  std::vector<DirEntry> entries;
  const std::string key = normalize(path);
  auto dir = nodes_.find(key);
  if (dir == nodes_.end() || !dir->second.is_directory) {
    return entries;
  }

  const std::string prefix = key == "/" ? key : key + "/";
  for (auto it = nodes_.lower_bound(prefix); it != nodes_.end(); ++it) {
    if (!it->first.starts_with(prefix)) {
      break;
    }
    const std::string rest = it->first.substr(prefix.size());
    if (rest.empty() || rest.find('/') != std::string::npos) {
      continue;  // grandchildren
    }
    entries.push_back(DirEntry{rest, it->second.is_directory, it->second.mtime});
  }
  return entries;
}

}  // namespace pipeaudit::fs
