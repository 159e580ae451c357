#include "weld/scan/resolver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "weld/common/path_utils.hpp"

namespace weld::scan {

namespace fs = std::filesystem;

auto FsResolver::Resolve(
    std::string_view importer, std::string_view specifier,
    graph::ImportKind /*kind*/) const -> std::optional<ResolvedPath> {
  bool relative = specifier.starts_with("./") ||
                  specifier.starts_with("../") || specifier == "." ||
                  specifier == "..";
  fs::path request(specifier);
  // Entry points are given relative to the working directory and may omit
  // the leading "./".
  if (!relative && !request.is_absolute() && !importer.empty()) {
    return std::nullopt;
  }

  fs::path base = cwd_;
  if (!importer.empty() && !common::IsVirtualPath(importer)) {
    base = fs::path(importer).parent_path();
  }
  fs::path target =
      request.is_absolute() ? request : (base / request).lexically_normal();

  auto found = [](const fs::path& path) {
    return ResolvedPath{.path = path.string(), .ignored = false};
  };
  if (fs_.IsFile(target)) {
    return found(target);
  }
  for (std::string_view extension : kExtensions) {
    fs::path candidate = target;
    candidate += extension;
    if (fs_.IsFile(candidate)) {
      return found(candidate);
    }
  }
  fs::path index = target / "index.js";
  if (fs_.IsFile(index)) {
    return found(index);
  }
  return std::nullopt;
}

}  // namespace weld::scan
