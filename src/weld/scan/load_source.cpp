#include "weld/scan/load_source.hpp"

#include <string>
#include <utility>

namespace weld::scan {

auto LoadSource(
    const PluginDriver& plugin_driver, const ResolvedPath& resolved_path,
    const FileSystem& fs) -> BatchResult<std::string> {
  auto loaded = plugin_driver.Load(HookLoadArgs{.id = resolved_path.path});
  if (!loaded) {
    return std::unexpected(BatchedErrors(std::move(loaded.error())));
  }
  if (*loaded) {
    return std::move((*loaded)->code);
  }
  if (resolved_path.ignored) {
    return std::string();
  }
  auto contents = fs.ReadToString(resolved_path.path);
  if (!contents) {
    return std::unexpected(BatchedErrors(std::move(contents.error())));
  }
  return std::move(*contents);
}

}  // namespace weld::scan
