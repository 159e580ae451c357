#include "weld/scan/file_system.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace weld::scan {

namespace fs = std::filesystem;

auto OsFileSystem::ReadToString(const fs::path& path) const
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(Diagnostic::HostError(
        path.string(), fmt::format("cannot read '{}'", path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto OsFileSystem::IsFile(const fs::path& path) const -> bool {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

auto OsFileSystem::WriteFile(const fs::path& path, std::string_view contents)
    -> Result<void> {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return std::unexpected(Diagnostic::HostError(fmt::format(
          "cannot create directory '{}': {}", path.parent_path().string(),
          ec.message())));
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("cannot write '{}'", path.string())));
  }
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  if (!out) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("write to '{}' failed", path.string())));
  }
  return {};
}

auto MemoryFileSystem::Key(const fs::path& path) -> std::string {
  return path.lexically_normal().generic_string();
}

void MemoryFileSystem::AddFile(const fs::path& path, std::string contents) {
  files_[Key(path)] = std::move(contents);
}

auto MemoryFileSystem::ReadToString(const fs::path& path) const
    -> Result<std::string> {
  auto it = files_.find(Key(path));
  if (it == files_.end()) {
    return std::unexpected(Diagnostic::HostError(
        path.generic_string(),
        fmt::format("cannot read '{}'", path.generic_string())));
  }
  return it->second;
}

auto MemoryFileSystem::IsFile(const fs::path& path) const -> bool {
  return files_.contains(Key(path));
}

auto MemoryFileSystem::WriteFile(
    const fs::path& path, std::string_view contents)
    -> Result<void> {
  files_[Key(path)] = std::string(contents);
  return {};
}

}  // namespace weld::scan
