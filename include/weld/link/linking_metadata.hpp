#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "weld/common/ids.hpp"

namespace weld::link {

// How a module's body is emitted.
enum class WrapKind : uint8_t {
  kNone,  // Top-level statements, in place
  kCjs,   // var require_x = __commonJS((exports, module) => { ... });
  kEsm,   // Bindings hoisted, body in var init_x = __esm(() => { ... });
};

[[nodiscard]] constexpr auto ToString(WrapKind kind) -> std::string_view {
  switch (kind) {
    case WrapKind::kNone:
      return "none";
    case WrapKind::kCjs:
      return "cjs";
    case WrapKind::kEsm:
      return "esm";
  }
  return "none";
}

// Per-module result of linking, indexed by ModuleId.
struct LinkingMetadata {
  WrapKind wrap_kind = WrapKind::kNone;
  // `require_x` or `init_x`; set iff wrap_kind != kNone.
  std::optional<SymbolRef> wrapper_ref;
  // Export name -> symbol holding the value. Empty for CommonJS modules,
  // whose exports are only known at run time.
  std::map<std::string, SymbolRef> resolved_exports;
  // Emit `var x_exports = {}; __export(x_exports, {...});`.
  bool needs_namespace_object = false;
  // Import records whose namespace variable this module declares:
  // `var import_x = __toESM(require_x());`.
  std::vector<ImportRecordId> namespace_records;
  // Symbols this module's output declares, by local index.
  std::vector<SymbolRef> declared_symbols;
  // Root symbols owned by other modules that this module's output names,
  // in first-use order.
  std::vector<SymbolRef> referenced_symbols;
  // Modules that must be present beyond the import records (the runtime).
  std::vector<ModuleId> dependencies;
  // Post-order execution index; UINT32_MAX for modules no entry reaches.
  uint32_t exec_order = UINT32_MAX;

  [[nodiscard]] auto IsWrapped() const -> bool {
    return wrap_kind != WrapKind::kNone;
  }
};

}  // namespace weld::link
