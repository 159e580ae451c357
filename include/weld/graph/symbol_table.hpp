#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "weld/common/ids.hpp"

namespace weld::graph {

// Per-chunk overlay: final identifier of each root symbol in one chunk.
using CanonicalNames = absl::flat_hash_map<SymbolRef, std::string>;

// A binding that renders as a property of another binding. Named imports of a
// CommonJS module read through the import's namespace object
// (`import_lib.name`) so the value stays live.
struct NamespaceAlias {
  SymbolRef namespace_ref;
  std::string property;
};

struct Symbol {
  std::string name;
  // Set by linking when this binding is the same variable as another one
  // (an import bound to its export).
  std::optional<SymbolRef> link;
  std::optional<NamespaceAlias> namespace_alias;
};

// Arena of every symbol in the graph, indexed by (module, local index).
// Owned by the module graph; chunks only layer CanonicalNames on top and
// never write here.
class SymbolTable {
 public:
  auto Declare(ModuleId owner, std::string name) -> SymbolRef;

  [[nodiscard]] auto Get(SymbolRef ref) const -> const Symbol&;
  [[nodiscard]] auto GetMut(SymbolRef ref) -> Symbol&;

  [[nodiscard]] auto SymbolCount(ModuleId owner) const -> uint32_t;

  // Follows links to the symbol that actually owns the variable.
  [[nodiscard]] auto Root(SymbolRef ref) const -> SymbolRef;

  // Makes `from` (and everything already linked to it) an alias of `to`.
  void Link(SymbolRef from, SymbolRef to);

  void SetNamespaceAlias(SymbolRef ref, NamespaceAlias alias);

  // Final name of `ref` inside the chunk that owns `names`. A missing entry
  // means the chunk would emit an unbound reference, which is a link bug.
  [[nodiscard]] auto CanonicalNameFor(
      SymbolRef ref, const CanonicalNames& names) const -> const std::string&;

 private:
  std::vector<std::vector<Symbol>> symbols_;  // Indexed by ModuleId
};

}  // namespace weld::graph
