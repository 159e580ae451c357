#include <string>
#include <utility>

#include <fmt/core.h>

#include "weld/graph/module.hpp"
#include "weld/graph/symbol_table.hpp"
#include "weld/link/link_stage.hpp"

namespace weld::link {

using graph::ExportsKind;

namespace {

auto NotExported(
    const graph::Module& importer, const graph::Module& target,
    const std::string& name) -> Diagnostic {
  return Diagnostic::Error(
      importer.pretty_path,
      fmt::format(
          "\"{}\" is not exported by \"{}\"", name, target.pretty_path));
}

}  // namespace

// Fills resolved_exports: local exports first, then named re-exports, then
// star re-exports for names not taken yet. A cycle through star exports
// stops at the module already in progress.
void LinkStage::ResolveExports(ModuleId id) {
  auto& state = export_state_[id.value];
  if (state != Visit::kNotStarted) {
    return;
  }
  state = Visit::kInProgress;

  auto& module_graph = output_.graph;
  const graph::Module& module = module_graph[id];
  if (module.exports_kind == ExportsKind::kCommonJs) {
    state = Visit::kDone;
    return;
  }

  // resolved_exports of other modules is reached through the metas vector,
  // which never reallocates here.
  auto& exports = output_.metas[id.value].resolved_exports;
  for (const auto& local : module.local_exports) {
    exports.try_emplace(
        local.exported, SymbolRef{.owner = id, .symbol = local.local});
  }

  for (const auto& re_export : module.re_exports) {
    const auto& record = module.import_records[re_export.record.value];
    ModuleId target_id = record.resolved_module;
    const graph::Module& target = module_graph[target_id];

    if (target.exports_kind == ExportsKind::kCommonJs) {
      if (re_export.imported == "*") {
        exports.try_emplace(re_export.exported, record.namespace_ref);
        continue;
      }
      // A named binding of a CommonJS module: a fresh symbol that reads
      // through the import's namespace variable.
      SymbolRef alias = module_graph.symbols.Declare(id, re_export.exported);
      module_graph.symbols.SetNamespaceAlias(
          alias, graph::NamespaceAlias{
                     .namespace_ref = record.namespace_ref,
                     .property = re_export.imported});
      exports.try_emplace(re_export.exported, alias);
      continue;
    }

    if (re_export.imported == "*") {
      exports.try_emplace(re_export.exported, target.namespace_ref);
      continue;
    }

    ResolveExports(target_id);
    const auto& target_exports =
        output_.metas[target_id.value].resolved_exports;
    auto it = target_exports.find(re_export.imported);
    if (it == target_exports.end()) {
      sink_.Report(NotExported(module, target, re_export.imported));
      continue;
    }
    exports.try_emplace(re_export.exported, it->second);
  }

  for (ImportRecordId star : module.star_exports) {
    ModuleId target_id = module.import_records[star.value].resolved_module;
    const graph::Module& target = module_graph[target_id];
    if (target.exports_kind == ExportsKind::kCommonJs) {
      sink_.Warning(
          module.pretty_path,
          fmt::format(
              "`export * from \"{}\"` re-exports nothing: CommonJS exports "
              "are not known statically",
              target.pretty_path));
      continue;
    }
    ResolveExports(target_id);
    for (const auto& [name, ref] :
         output_.metas[target_id.value].resolved_exports) {
      if (name != "default") {
        exports.try_emplace(name, ref);
      }
    }
  }

  state = Visit::kDone;
}

// Links every named import of `id` to the symbol that holds its value.
void LinkStage::BindImports(ModuleId id) {
  auto& module_graph = output_.graph;
  const graph::Module& module = module_graph[id];

  for (const auto& named : module.named_imports) {
    const auto& record = module.import_records[named.record.value];
    ModuleId target_id = record.resolved_module;
    const graph::Module& target = module_graph[target_id];
    SymbolRef local{.owner = id, .symbol = named.local};

    if (target.exports_kind == ExportsKind::kCommonJs) {
      if (named.imported == "*") {
        module_graph.symbols.Link(local, record.namespace_ref);
      } else {
        module_graph.symbols.SetNamespaceAlias(
            local, graph::NamespaceAlias{
                       .namespace_ref = record.namespace_ref,
                       .property = named.imported});
      }
      continue;
    }

    if (named.imported == "*") {
      module_graph.symbols.Link(local, target.namespace_ref);
      continue;
    }

    const auto& target_exports =
        output_.metas[target_id.value].resolved_exports;
    auto it = target_exports.find(named.imported);
    if (it == target_exports.end()) {
      sink_.Report(NotExported(module, target, named.imported));
      continue;
    }
    module_graph.symbols.Link(local, it->second);
  }
}

}  // namespace weld::link
