#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "weld/common/ids.hpp"

namespace weld::graph {

enum class ImportKind : uint8_t {
  kImport,         // import declaration, export ... from
  kDynamicImport,  // import("x")
  kRequire,        // require("x")
};

// Import and Require targets are always known before code generation; a
// dynamic import's specifier may be computed at runtime, so it only ever
// establishes reachability, never a linkable binding.
[[nodiscard]] constexpr auto IsStatic(ImportKind kind) -> bool {
  switch (kind) {
    case ImportKind::kImport:
    case ImportKind::kRequire:
      return true;
    case ImportKind::kDynamicImport:
      return false;
  }
  return false;
}

// Spelling used in diagnostics.
[[nodiscard]] constexpr auto ToString(ImportKind kind) -> std::string_view {
  switch (kind) {
    case ImportKind::kImport:
      return "import-statement";
    case ImportKind::kDynamicImport:
      return "dynamic-import";
    case ImportKind::kRequire:
      return "require-call";
  }
  return "import-statement";
}

struct ImportRecord;

// An import edge as written, before resolution. Only the scan stage turns it
// into an ImportRecord, and only once the resolver produced a target module.
struct RawImportRecord {
  RawImportRecord(
      std::string module_request, ImportKind kind, SymbolRef namespace_ref)
      : module_request(std::move(module_request)),
        kind(kind),
        namespace_ref(namespace_ref) {
  }

  [[nodiscard]] auto IsStatic() const -> bool {
    return graph::IsStatic(kind);
  }

  // Consumes the raw record. `resolved_module` must be valid.
  auto IntoImportRecord(ModuleId resolved_module) && -> ImportRecord;

  std::string module_request;
  ImportKind kind;
  // Binding that holds the imported module's namespace when one has to be
  // materialized (`import * as ns`, CommonJS interop).
  SymbolRef namespace_ref;
  // What the edge binds: `* as ns`, `default`, and any other named binding.
  bool contains_import_star = false;
  bool contains_import_default = false;
  bool contains_import_named = false;
};

// Immutable once built.
struct ImportRecord {
  std::string module_request;
  ModuleId resolved_module;
  ImportKind kind;
  SymbolRef namespace_ref;
  bool contains_import_star = false;
  bool contains_import_default = false;
  bool contains_import_named = false;

  [[nodiscard]] auto IsStatic() const -> bool {
    return graph::IsStatic(kind);
  }

  // Runs the target for its side effects only (`import "x"`).
  [[nodiscard]] auto IsPlainImport() const -> bool {
    return !contains_import_star && !contains_import_default &&
           !contains_import_named;
  }
};

}  // namespace weld::graph
