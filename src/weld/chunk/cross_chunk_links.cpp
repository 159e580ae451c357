#include <cstdint>
#include <string>

#include <fmt/core.h>

#include "weld/chunk/chunk_graph.hpp"
#include "weld/common/output_format.hpp"
#include "weld/graph/module.hpp"

namespace weld::chunk {

namespace {

auto UniqueAlias(const Chunk& chunk, const std::string& base) -> std::string {
  if (!chunk.IsExportAliasTaken(base)) {
    return base;
  }
  for (uint32_t n = 1;; ++n) {
    std::string candidate = fmt::format("{}${}", base, n);
    if (!chunk.IsExportAliasTaken(candidate)) {
      return candidate;
    }
  }
}

// Whether the chunk's entry module exports by name. CommonJS entries export
// through `module.exports` or the wrapper call, and the app format has no
// export surface at all.
auto HasNamedEntryExports(
    const Chunk& chunk, const link::LinkStageOutput& link) -> bool {
  return chunk.entry_module && link.format != OutputFormat::kApp &&
         link.graph[*chunk.entry_module].exports_kind !=
             graph::ExportsKind::kCommonJs;
}

}  // namespace

void ComputeCrossChunkLinks(
    ChunkGraph& chunk_graph, const link::LinkStageOutput& link) {
  const auto& symbols = link.graph.symbols;

  // Entry exports claim their public names before any cross-chunk alias is
  // handed out.
  for (auto& chunk : chunk_graph.chunks) {
    if (!HasNamedEntryExports(chunk, link)) {
      continue;
    }
    for (const auto& [name, ref] :
         link.Meta(*chunk.entry_module).resolved_exports) {
      chunk.AddNamedExport(symbols.Root(ref), name);
    }
  }

  for (uint32_t index = 0; index < chunk_graph.chunks.size(); ++index) {
    ChunkId chunk_id{index};

    auto depend_on = [&](ModuleId module) {
      ChunkId owner = chunk_graph.ChunkOf(module);
      if (owner != chunk_id) {
        chunk_graph[chunk_id].ImportsFrom(owner);
      }
    };
    auto import_symbol = [&](SymbolRef root) {
      ChunkId owner = chunk_graph.ChunkOf(root.owner);
      if (owner == chunk_id) {
        return;
      }
      auto& imports = chunk_graph[chunk_id].ImportsFrom(owner);
      for (const auto& item : imports.items) {
        if (item.import_ref == root) {
          return;
        }
      }
      Chunk& exporter = chunk_graph[owner];
      std::string alias = exporter.AddExport(
          root, UniqueAlias(exporter, symbols.Get(root).name));
      imports.items.push_back(
          CrossChunkImportItem{.export_alias = alias, .import_ref = root});
    };

    for (ModuleId module : chunk_graph[chunk_id].modules) {
      const auto& meta = link.Meta(module);
      // Chunks holding static dependencies are loaded first, whether or not
      // any binding comes from them.
      for (const auto& record : link.graph[module].import_records) {
        if (record.IsStatic()) {
          depend_on(record.resolved_module);
        }
      }
      for (ModuleId dep : meta.dependencies) {
        depend_on(dep);
      }
      for (SymbolRef ref : meta.referenced_symbols) {
        import_symbol(ref);
      }
    }

    const Chunk& chunk = chunk_graph[chunk_id];
    if (HasNamedEntryExports(chunk, link)) {
      for (const auto& [name, ref] :
           link.Meta(*chunk.entry_module).resolved_exports) {
        SymbolRef root = symbols.Root(ref);
        if (const auto& alias = symbols.Get(root).namespace_alias) {
          root = symbols.Root(alias->namespace_ref);
        }
        import_symbol(root);
      }
    }
  }
}

}  // namespace weld::chunk
