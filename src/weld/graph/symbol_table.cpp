#include "weld/graph/symbol_table.hpp"

#include <cstdint>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "weld/common/internal_error.hpp"

namespace weld::graph {

auto SymbolTable::Declare(ModuleId owner, std::string name) -> SymbolRef {
  if (owner.value >= symbols_.size()) {
    symbols_.resize(owner.value + 1);
  }
  auto& module_symbols = symbols_[owner.value];
  SymbolRef ref{
      .owner = owner,
      .symbol = static_cast<uint32_t>(module_symbols.size())};
  module_symbols.push_back(Symbol{.name = std::move(name)});
  return ref;
}

auto SymbolTable::Get(SymbolRef ref) const -> const Symbol& {
  if (ref.owner.value >= symbols_.size() ||
      ref.symbol >= symbols_[ref.owner.value].size()) {
    common::ThrowInternalError(
        "SymbolTable::Get",
        fmt::format(
            "symbol {} of module {} does not exist", ref.symbol,
            ref.owner.value));
  }
  return symbols_[ref.owner.value][ref.symbol];
}

auto SymbolTable::GetMut(SymbolRef ref) -> Symbol& {
  // Reuse the bounds check of the const accessor.
  return const_cast<Symbol&>(std::as_const(*this).Get(ref));
}

auto SymbolTable::SymbolCount(ModuleId owner) const -> uint32_t {
  if (owner.value >= symbols_.size()) {
    return 0;
  }
  return static_cast<uint32_t>(symbols_[owner.value].size());
}

auto SymbolTable::Root(SymbolRef ref) const -> SymbolRef {
  while (true) {
    const auto& symbol = Get(ref);
    if (!symbol.link) {
      return ref;
    }
    ref = *symbol.link;
  }
}

void SymbolTable::Link(SymbolRef from, SymbolRef to) {
  SymbolRef from_root = Root(from);
  SymbolRef to_root = Root(to);
  if (from_root == to_root) {
    return;
  }
  GetMut(from_root).link = to_root;
}

void SymbolTable::SetNamespaceAlias(SymbolRef ref, NamespaceAlias alias) {
  GetMut(ref).namespace_alias = std::move(alias);
}

auto SymbolTable::CanonicalNameFor(
    SymbolRef ref, const CanonicalNames& names) const -> const std::string& {
  SymbolRef root = Root(ref);
  auto it = names.find(root);
  if (it == names.end()) {
    common::ThrowInternalError(
        "SymbolTable::CanonicalNameFor",
        fmt::format(
            "symbol '{}' (module {}, index {}) has no canonical name in this "
            "chunk",
            Get(root).name, root.owner.value, root.symbol));
  }
  return it->second;
}

}  // namespace weld::graph
