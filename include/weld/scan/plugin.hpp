#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/graph/import_record.hpp"

namespace weld::scan {

struct HookResolveIdArgs {
  // Resource id of the importing module; empty for entry points.
  std::string_view importer;
  std::string_view specifier;
  graph::ImportKind kind;
};

struct HookResolveIdOutput {
  std::string id;
  // Ignored modules load as empty text.
  bool ignored = false;
};

struct HookLoadArgs {
  std::string_view id;
};

struct HookLoadOutput {
  std::string code;
};

// Build extension point. Hooks that do not apply return std::nullopt; an
// error aborts the operation that ran the hook.
class Plugin {
 public:
  Plugin() = default;
  virtual ~Plugin() = default;
  Plugin(const Plugin&) = delete;
  auto operator=(const Plugin&) -> Plugin& = delete;
  Plugin(Plugin&&) = delete;
  auto operator=(Plugin&&) -> Plugin& = delete;

  [[nodiscard]] virtual auto Name() const -> std::string_view = 0;

  [[nodiscard]] virtual auto ResolveId(const HookResolveIdArgs& /*args*/) const
      -> Result<std::optional<HookResolveIdOutput>> {
    return std::nullopt;
  }

  [[nodiscard]] virtual auto Load(const HookLoadArgs& /*args*/) const
      -> Result<std::optional<HookLoadOutput>> {
    return std::nullopt;
  }
};

// Runs hooks in registration order; the first non-empty result wins. Hook
// errors come back as kPluginError diagnostics naming the plugin and hook.
// Hooks may be called from worker threads.
class PluginDriver {
 public:
  PluginDriver() = default;
  explicit PluginDriver(std::vector<std::unique_ptr<Plugin>> plugins)
      : plugins_(std::move(plugins)) {
  }

  [[nodiscard]] auto ResolveId(const HookResolveIdArgs& args) const
      -> Result<std::optional<HookResolveIdOutput>>;

  [[nodiscard]] auto Load(const HookLoadArgs& args) const
      -> Result<std::optional<HookLoadOutput>>;

  [[nodiscard]] auto PluginCount() const -> size_t {
    return plugins_.size();
  }

 private:
  std::vector<std::unique_ptr<Plugin>> plugins_;
};

}  // namespace weld::scan
