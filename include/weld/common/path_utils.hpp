#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace weld::common {

// Virtual modules (the runtime, plugin-provided ids) start with a NUL byte.
[[nodiscard]] inline auto IsVirtualPath(std::string_view path) -> bool {
  return !path.empty() && path.front() == '\0';
}

// `target` relative to `base`, in the platform's native form. No further
// normalization: source-map consumers expect exactly this shape.
auto RelativePath(
    const std::filesystem::path& target, const std::filesystem::path& base)
    -> std::string;

// Specifier for importing the chunk file `to_file` from chunk file
// `from_file`. Both are relative to the output directory. Always starts with
// "./" or "../" and uses forward slashes.
auto ImportSpecifierBetween(
    std::string_view from_file, std::string_view to_file)
    -> std::string;

// Human-readable path used in comments and diagnostics, never semantic.
auto PrettyPath(std::string_view resource_id, const std::filesystem::path& cwd)
    -> std::string;

// File stem turned into a valid JavaScript identifier ("my-lib.js" ->
// "my_lib").
auto LegalIdentifierFromPath(std::string_view path) -> std::string;

// File stem usable as a chunk name ("\0weld:runtime" -> "weld_runtime").
auto ChunkNameFromPath(std::string_view path) -> std::string;

}  // namespace weld::common
