#include "weld/chunk/deconflict.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace weld::chunk {

namespace {

constexpr std::array<std::string_view, 58> kReservedNames = {
    // Keywords and strict-mode reserved words
    "await", "break", "case", "catch", "class", "const", "continue",
    "debugger", "default", "delete", "do", "else", "enum", "export",
    "extends", "false", "finally", "for", "function", "if", "implements",
    "import", "in", "instanceof", "interface", "let", "new", "null",
    "package", "private", "protected", "public", "return", "static", "super",
    "switch", "this", "throw", "true", "try", "typeof", "var", "void",
    "while", "with", "yield",
    // Names generated code and module systems rely on
    "arguments", "eval", "undefined", "NaN", "Infinity", "require", "module",
    "exports", "Object", "Symbol", "globalThis", "Promise",
};

}  // namespace

Renamer::Renamer() {
  for (std::string_view name : kReservedNames) {
    used_.emplace(name);
  }
}

void Renamer::Reserve(std::string_view name) {
  used_.emplace(name);
}

auto Renamer::Assign(std::string_view base) -> std::string {
  std::string candidate(base);
  for (uint32_t n = 1; used_.contains(candidate); ++n) {
    candidate = fmt::format("{}${}", base, n);
  }
  used_.insert(candidate);
  return candidate;
}

void DeconflictChunkSymbols(Chunk& chunk, const link::LinkStageOutput& link) {
  const auto& symbols = link.graph.symbols;
  Renamer renamer;
  for (ModuleId module : chunk.modules) {
    for (const auto& name : link.graph[module].unresolved_references) {
      renamer.Reserve(name);
    }
  }

  auto assign = [&](SymbolRef ref) {
    SymbolRef root = symbols.Root(ref);
    if (!chunk.canonical_names.contains(root)) {
      chunk.canonical_names.emplace(
          root, renamer.Assign(symbols.Get(root).name));
    }
  };
  for (ModuleId module : chunk.modules) {
    for (SymbolRef ref : link.Meta(module).declared_symbols) {
      assign(ref);
    }
  }
  for (const auto& imports : chunk.imports_from_other_chunks) {
    for (const auto& item : imports.items) {
      assign(item.import_ref);
    }
  }
}

}  // namespace weld::chunk
