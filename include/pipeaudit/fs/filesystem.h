#pragma once

#include "pipeaudit/core/time.h"

#include <optional>
#include <string>
#include <vector>

namespace pipeaudit::fs {

struct DirEntry {
  std::string name;  // entry name, not a full path
  bool is_directory{false};
  core::Timestamp last_modified;
};

// IFileSystem is the read-only view of the pipeline root used by every checker.
// Paths are plain strings joined with '/'. Implementations never throw: absence and
// I/O errors are reported as std::nullopt or an empty listing.
class IFileSystem {
 public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual bool exists(const std::string& path) const = 0;
  [[nodiscard]] virtual bool is_directory(const std::string& path) const = 0;
  [[nodiscard]] virtual std::optional<core::Timestamp> last_modified(
      const std::string& path) const = 0;
  [[nodiscard]] virtual std::optional<std::string> read_text(const std::string& path) const = 0;
  // Direct children only, sorted by name.
  [[nodiscard]] virtual std::vector<DirEntry> list_directory(const std::string& path) const = 0;

 protected:
  IFileSystem() = default;
  IFileSystem(const IFileSystem&) = default;
  IFileSystem& operator=(const IFileSystem&) = default;
  IFileSystem(IFileSystem&&) = default;
  IFileSystem& operator=(IFileSystem&&) = default;
};

// join_path appends a relative locator to a root, collapsing duplicate separators.
[[nodiscard]] std::string join_path(const std::string& root, const std::string& relative);

}  // namespace pipeaudit::fs
