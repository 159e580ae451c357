#include "weld/common/path_utils.hpp"

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace weld::common {

namespace fs = std::filesystem;

namespace {

auto StripVirtualPrefix(std::string_view path) -> std::string_view {
  if (IsVirtualPath(path)) {
    path.remove_prefix(1);
  }
  return path;
}

// Last path component without its extension. Virtual ids such as
// "weld:runtime" are not split on ':'.
auto FileStem(std::string_view path) -> std::string {
  path = StripVirtualPrefix(path);
  auto slash = path.find_last_of("/\\");
  if (slash != std::string_view::npos) {
    path.remove_prefix(slash + 1);
  }
  auto dot = path.rfind('.');
  if (dot != std::string_view::npos && dot != 0) {
    path = path.substr(0, dot);
  }
  return std::string(path);
}

auto IsIdentifierChar(char c) -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
         c == '$';
}

}  // namespace

auto RelativePath(const fs::path& target, const fs::path& base)
    -> std::string {
  auto relative = target.lexically_relative(base);
  if (relative.empty()) {
    return target.string();
  }
  return relative.string();
}

auto ImportSpecifierBetween(
    std::string_view from_file, std::string_view to_file)
    -> std::string {
  fs::path from_dir = fs::path(from_file).parent_path();
  std::string relative =
      fs::path(to_file).lexically_relative(from_dir).generic_string();
  if (relative.starts_with("../") || relative.starts_with("./")) {
    return relative;
  }
  return "./" + relative;
}

auto PrettyPath(std::string_view resource_id, const fs::path& cwd)
    -> std::string {
  if (IsVirtualPath(resource_id)) {
    return std::string(StripVirtualPrefix(resource_id));
  }
  fs::path path(resource_id);
  if (path.is_relative() || cwd.empty()) {
    return path.generic_string();
  }
  auto relative = path.lexically_relative(cwd);
  if (relative.empty()) {
    return path.generic_string();
  }
  return relative.generic_string();
}

auto LegalIdentifierFromPath(std::string_view path) -> std::string {
  std::string name = FileStem(path);
  for (char& c : name) {
    if (!IsIdentifierChar(c)) {
      c = '_';
    }
  }
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) != 0) {
    name.insert(name.begin(), '_');
  }
  return name;
}

auto ChunkNameFromPath(std::string_view path) -> std::string {
  std::string name = FileStem(path);
  for (char& c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' &&
        c != '-' && c != '.') {
      c = '_';
    }
  }
  if (name.empty()) {
    return "chunk";
  }
  return name;
}

}  // namespace weld::common
