#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/common/worker_pool.hpp"
#include "weld/graph/module_graph.hpp"
#include "weld/scan/file_system.hpp"
#include "weld/scan/plugin.hpp"
#include "weld/scan/resolver.hpp"

namespace weld::scan {

struct InputItem {
  // Logical entry name; the file stem is used when absent.
  std::optional<std::string> name;
  // Request as given by the user, resolved against the working directory.
  std::string import;
};

// Builds the module graph: breadth-first from the entries, in entry order,
// loading and scanning each wave of newly discovered modules on the pool and
// resolving their import records in order on the calling thread. Module ids
// follow discovery order; the runtime module is always module 0.
class ScanStage {
 public:
  ScanStage(
      const PluginDriver& plugin_driver, const Resolver& resolver,
      const FileSystem& fs, common::WorkerPool& pool,
      std::filesystem::path cwd)
      : plugin_driver_(plugin_driver),
        resolver_(resolver),
        fs_(fs),
        pool_(pool),
        cwd_(std::move(cwd)) {
  }

  auto Scan(const std::vector<InputItem>& inputs)
      -> BatchResult<graph::ModuleGraph>;

 private:
  // Plugins first, then the resolver.
  auto ResolveId(
      std::string_view importer, std::string_view specifier,
      graph::ImportKind kind) const -> Result<std::optional<ResolvedPath>>;

  const PluginDriver& plugin_driver_;
  const Resolver& resolver_;
  const FileSystem& fs_;
  common::WorkerPool& pool_;
  std::filesystem::path cwd_;
};

}  // namespace weld::scan
