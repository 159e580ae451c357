#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "weld/graph/import_record.hpp"
#include "weld/scan/file_system.hpp"

namespace weld::scan {

struct ResolvedPath {
  // Absolute path, or a NUL-prefixed virtual id from a plugin.
  std::string path;
  bool ignored = false;

  auto operator==(const ResolvedPath&) const -> bool = default;
};

class Resolver {
 public:
  Resolver() = default;
  virtual ~Resolver() = default;
  Resolver(const Resolver&) = delete;
  auto operator=(const Resolver&) -> Resolver& = delete;
  Resolver(Resolver&&) = delete;
  auto operator=(Resolver&&) -> Resolver& = delete;

  // `importer` is the importing module's resource id, empty for entry
  // points. std::nullopt means the request names nothing.
  [[nodiscard]] virtual auto Resolve(
      std::string_view importer, std::string_view specifier,
      graph::ImportKind kind) const -> std::optional<ResolvedPath> = 0;
};

// Relative and absolute requests against the file system. Bare specifiers
// never resolve here; a plugin has to claim them.
class FsResolver final : public Resolver {
 public:
  FsResolver(const FileSystem& fs, std::filesystem::path cwd)
      : fs_(fs), cwd_(std::move(cwd)) {
  }

  [[nodiscard]] auto Resolve(
      std::string_view importer, std::string_view specifier,
      graph::ImportKind kind) const -> std::optional<ResolvedPath> override;

 private:
  static constexpr std::array<std::string_view, 4> kExtensions = {
      ".js", ".mjs", ".cjs", ".ts"};

  const FileSystem& fs_;
  std::filesystem::path cwd_;
};

}  // namespace weld::scan
