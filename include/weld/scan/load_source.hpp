#pragma once

#include <string>

#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/scan/file_system.hpp"
#include "weld/scan/plugin.hpp"
#include "weld/scan/resolver.hpp"

namespace weld::scan {

// Source text of a resolved module: a plugin's Load result if any, else
// empty text for ignored paths, else the file's contents.
auto LoadSource(
    const PluginDriver& plugin_driver, const ResolvedPath& resolved_path,
    const FileSystem& fs) -> BatchResult<std::string>;

}  // namespace weld::scan
