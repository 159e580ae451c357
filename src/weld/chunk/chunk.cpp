#include "weld/chunk/chunk.hpp"

#include <optional>
#include <string>
#include <utility>

namespace weld::chunk {

auto Chunk::ExportAliasOf(SymbolRef symbol) const
    -> std::optional<std::string> {
  auto it = export_index_.find(symbol);
  if (it == export_index_.end()) {
    return std::nullopt;
  }
  return exports[it->second].alias;
}

auto Chunk::AddExport(SymbolRef symbol, std::string alias) -> std::string {
  if (auto existing = ExportAliasOf(symbol)) {
    return *existing;
  }
  AddNamedExport(symbol, alias);
  return alias;
}

void Chunk::AddNamedExport(SymbolRef symbol, std::string alias) {
  export_index_.try_emplace(symbol, exports.size());
  export_aliases_.try_emplace(alias, symbol);
  exports.push_back(ChunkExport{.symbol = symbol, .alias = std::move(alias)});
}

auto Chunk::ImportsFrom(ChunkId source) -> ChunkImports& {
  for (auto& imports : imports_from_other_chunks) {
    if (imports.chunk == source) {
      return imports;
    }
  }
  imports_from_other_chunks.push_back(
      ChunkImports{.chunk = source, .items = {}});
  return imports_from_other_chunks.back();
}

}  // namespace weld::chunk
