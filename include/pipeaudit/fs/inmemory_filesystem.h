#pragma once

#include "pipeaudit/fs/filesystem.h"

#include <map>

namespace pipeaudit::fs {

// InMemoryFileSystem stores a pipeline tree in a std::map keyed by full path.
// std::map keeps listings sorted, so replays are deterministic.
// Suitable for checker tests and for replaying a captured tree.
class InMemoryFileSystem final : public IFileSystem {
 public:
  // Adds a directory and any missing parents (parents take the same mtime).
  void add_directory(const std::string& path, core::Timestamp mtime);
  // Adds or replaces a file; missing parent directories are created.
  void add_file(const std::string& path, std::string content, core::Timestamp mtime);
  void set_last_modified(const std::string& path, core::Timestamp mtime);
  // Removes the entry and everything below it.
  void remove(const std::string& path);

  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] bool is_directory(const std::string& path) const override;
  [[nodiscard]] std::optional<core::Timestamp> last_modified(
      const std::string& path) const override;
  [[nodiscard]] std::optional<std::string> read_text(const std::string& path) const override;
  [[nodiscard]] std::vector<DirEntry> list_directory(const std::string& path) const override;

 private:
  struct Node {
    bool is_directory{false};
    std::string content;
    core::Timestamp mtime;
  };

  void ensure_parents(const std::string& path, core::Timestamp mtime);

  std::map<std::string, Node> nodes_;
};

}  // namespace pipeaudit::fs
