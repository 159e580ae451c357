#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld::scan {

// Everything the bundler reads from or writes to disk goes through here, so
// tests can run against an in-memory tree.
class FileSystem {
 public:
  FileSystem() = default;
  virtual ~FileSystem() = default;
  FileSystem(const FileSystem&) = delete;
  auto operator=(const FileSystem&) -> FileSystem& = delete;
  FileSystem(FileSystem&&) = delete;
  auto operator=(FileSystem&&) -> FileSystem& = delete;

  [[nodiscard]] virtual auto ReadToString(const std::filesystem::path& path)
      const -> Result<std::string> = 0;

  [[nodiscard]] virtual auto IsFile(const std::filesystem::path& path) const
      -> bool = 0;

  // Creates missing parent directories.
  virtual auto WriteFile(
      const std::filesystem::path& path, std::string_view contents)
      -> Result<void> = 0;
};

class OsFileSystem final : public FileSystem {
 public:
  [[nodiscard]] auto ReadToString(const std::filesystem::path& path) const
      -> Result<std::string> override;
  [[nodiscard]] auto IsFile(const std::filesystem::path& path) const
      -> bool override;
  auto WriteFile(const std::filesystem::path& path, std::string_view contents)
      -> Result<void> override;
};

// Paths are compared in lexically normal generic form.
class MemoryFileSystem final : public FileSystem {
 public:
  void AddFile(const std::filesystem::path& path, std::string contents);

  [[nodiscard]] auto ReadToString(const std::filesystem::path& path) const
      -> Result<std::string> override;
  [[nodiscard]] auto IsFile(const std::filesystem::path& path) const
      -> bool override;
  auto WriteFile(const std::filesystem::path& path, std::string_view contents)
      -> Result<void> override;

  [[nodiscard]] auto Files() const
      -> const std::map<std::string, std::string>& {
    return files_;
  }

 private:
  static auto Key(const std::filesystem::path& path) -> std::string;

  std::map<std::string, std::string> files_;
};

}  // namespace weld::scan
