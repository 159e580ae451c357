#include "weld/scan/plugin.hpp"

#include <optional>
#include <string_view>
#include <utility>

namespace weld::scan {

namespace {

auto AsPluginError(const Plugin& plugin, std::string_view hook, Diagnostic diag)
    -> Diagnostic {
  if (diag.primary.kind == DiagKind::kPluginError) {
    return diag;
  }
  auto wrapped =
      Diagnostic::PluginError(plugin.Name(), hook, diag.primary.message);
  wrapped.primary.location = std::move(diag.primary.location);
  wrapped.notes = std::move(diag.notes);
  return wrapped;
}

}  // namespace

auto PluginDriver::ResolveId(const HookResolveIdArgs& args) const
    -> Result<std::optional<HookResolveIdOutput>> {
  for (const auto& plugin : plugins_) {
    auto result = plugin->ResolveId(args);
    if (!result) {
      return std::unexpected(
          AsPluginError(*plugin, "resolve_id", std::move(result.error())));
    }
    if (*result) {
      return std::move(*result);
    }
  }
  return std::nullopt;
}

auto PluginDriver::Load(const HookLoadArgs& args) const
    -> Result<std::optional<HookLoadOutput>> {
  for (const auto& plugin : plugins_) {
    auto result = plugin->Load(args);
    if (!result) {
      return std::unexpected(
          AsPluginError(*plugin, "load", std::move(result.error())));
    }
    if (*result) {
      return std::move(*result);
    }
  }
  return std::nullopt;
}

}  // namespace weld::scan
