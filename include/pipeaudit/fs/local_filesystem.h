#pragma once

#include "pipeaudit/fs/filesystem.h"

namespace pipeaudit::fs {

// LocalFileSystem reads the host filesystem through std::filesystem.
// Modification times come from stat(2) so they sit on the system_clock epoch.
class LocalFileSystem final : public IFileSystem {
 public:
  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] bool is_directory(const std::string& path) const override;
  [[nodiscard]] std::optional<core::Timestamp> last_modified(
      const std::string& path) const override;
  [[nodiscard]] std::optional<std::string> read_text(const std::string& path) const override;
  [[nodiscard]] std::vector<DirEntry> list_directory(const std::string& path) const override;
};

}  // namespace pipeaudit::fs
