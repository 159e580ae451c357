#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "weld/common/bitset.hpp"
#include "weld/common/ids.hpp"
#include "weld/graph/symbol_table.hpp"

namespace weld::chunk {

// One symbol a chunk imports from another chunk. The alias is the name the
// exporting chunk exports it under.
struct CrossChunkImportItem {
  std::optional<std::string> export_alias;
  SymbolRef import_ref;
};

// Everything a chunk imports from one other chunk. An empty item list still
// makes the chunk load the other one first.
struct ChunkImports {
  ChunkId chunk;
  std::vector<CrossChunkImportItem> items;
};

struct ChunkExport {
  SymbolRef symbol;  // Root symbol declared in this chunk
  std::string alias;
};

// Modules sharing one reachability bitset, plus the per-chunk overlays the
// renderer needs: canonical names and cross-chunk glue.
struct Chunk {
  std::optional<ModuleId> entry_module;
  // Execution order.
  std::vector<ModuleId> modules;
  std::optional<std::string> name;
  // Relative to the output directory; assigned after chunking.
  std::optional<std::string> preliminary_filename;
  common::BitSet bits;
  graph::CanonicalNames canonical_names;
  // One entry per source chunk, in first-discovery order.
  std::vector<ChunkImports> imports_from_other_chunks;
  // Entry exports first, then symbols other chunks import, in discovery
  // order. One symbol may appear under several aliases.
  std::vector<ChunkExport> exports;

  [[nodiscard]] auto IsEntry() const -> bool {
    return entry_module.has_value();
  }

  // First alias `symbol` is exported under, if any.
  [[nodiscard]] auto ExportAliasOf(SymbolRef symbol) const
      -> std::optional<std::string>;

  // Exports `symbol` under `alias` unless it already has an alias; returns
  // the alias in effect.
  auto AddExport(SymbolRef symbol, std::string alias) -> std::string;

  // Exports `symbol` under `alias` even if it already has one.
  void AddNamedExport(SymbolRef symbol, std::string alias);

  // The import list for `source`, created on first use.
  auto ImportsFrom(ChunkId source) -> ChunkImports&;

  [[nodiscard]] auto IsExportAliasTaken(const std::string& alias) const
      -> bool {
    return export_aliases_.contains(alias);
  }

 private:
  absl::flat_hash_map<SymbolRef, size_t> export_index_;
  absl::flat_hash_map<std::string, SymbolRef> export_aliases_;
};

}  // namespace weld::chunk
