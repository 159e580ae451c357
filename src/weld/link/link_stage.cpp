#include "weld/link/link_stage.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "weld/common/internal_error.hpp"
#include "weld/common/path_utils.hpp"
#include "weld/graph/import_record.hpp"
#include "weld/graph/module.hpp"

namespace weld::link {

using graph::ExportsKind;
using graph::ImportKind;

auto LinkStageOutput::RuntimeHelper(std::string_view name) const
    -> SymbolRef {
  const auto& exports = Meta(graph.runtime).resolved_exports;
  auto it = exports.find(std::string(name));
  if (it == exports.end()) {
    common::ThrowInternalError(
        "LinkStageOutput::RuntimeHelper",
        fmt::format("runtime module does not export '{}'", name));
  }
  return it->second;
}

LinkStage::LinkStage(graph::ModuleGraph module_graph, OutputFormat format) {
  output_.metas.resize(module_graph.ModuleCount());
  export_state_.resize(module_graph.ModuleCount(), Visit::kNotStarted);
  output_.graph = std::move(module_graph);
  output_.format = format;
}

auto LinkStage::Link() && -> BatchResult<LinkStageOutput> {
  SortModules();
  DetermineWrapKinds();
  DeclareWrappers();
  for (ModuleId id : output_.sorted_modules) {
    MarkNamespaceUses(id);
  }
  for (ModuleId id : output_.sorted_modules) {
    ResolveExports(id);
  }
  for (ModuleId id : output_.sorted_modules) {
    BindImports(id);
  }
  CheckEntryExports();
  if (sink_.HasErrors()) {
    return std::unexpected(sink_.TakeBatch());
  }
  for (ModuleId id : output_.sorted_modules) {
    CollectReferences(id);
  }
  output_.warnings = sink_.GetDiagnostics();
  return std::move(output_);
}

// Depth-first from the runtime, then the entries in order, following import
// records in order. Post-order gives dependencies before dependents; a
// module already on the stack (a cycle) is not revisited.
void LinkStage::SortModules() {
  auto& module_graph = output_.graph;
  std::vector<bool> visited(module_graph.ModuleCount(), false);

  // (module, next record index) frames.
  std::vector<std::pair<ModuleId, size_t>> stack;
  auto visit = [&](ModuleId root) {
    if (visited[root.value]) {
      return;
    }
    visited[root.value] = true;
    stack.emplace_back(root, 0);
    while (!stack.empty()) {
      auto& [id, next] = stack.back();
      const auto& records = module_graph[id].import_records;
      if (next < records.size()) {
        ModuleId dep = records[next++].resolved_module;
        if (!visited[dep.value]) {
          visited[dep.value] = true;
          stack.emplace_back(dep, 0);
        }
        continue;
      }
      output_.metas[id.value].exec_order =
          static_cast<uint32_t>(output_.sorted_modules.size());
      output_.sorted_modules.push_back(id);
      stack.pop_back();
    }
  };

  visit(module_graph.runtime);
  for (const auto& entry : module_graph.entries) {
    visit(entry.module);
  }
}

void LinkStage::Wrap(ModuleId id, WrapKind kind) {
  auto& meta = output_.metas[id.value];
  if (meta.wrap_kind == WrapKind::kNone) {
    meta.wrap_kind = kind;
  }
}

// The record flags decide which namespaces materialize: the namespace object
// of an ES module bound with `* as` or loaded by `import()`, and the
// `__toESM` variable that every binding of a CommonJS import reads through.
// A plain `import "x"` needs neither.
void LinkStage::MarkNamespaceUses(ModuleId id) {
  const auto& module_graph = output_.graph;
  const auto& records = module_graph[id].import_records;
  for (size_t i = 0; i < records.size(); ++i) {
    const auto& record = records[i];
    if (record.kind == ImportKind::kRequire) {
      continue;
    }
    ModuleId target = record.resolved_module;
    if (module_graph[target].exports_kind == ExportsKind::kCommonJs) {
      if (record.kind == ImportKind::kImport && !record.IsPlainImport()) {
        AddNamespaceRecord(id, ImportRecordId{static_cast<uint32_t>(i)});
      }
    } else if (record.contains_import_star) {
      output_.metas[target.value].needs_namespace_object = true;
    }
  }
}

void LinkStage::AddNamespaceRecord(ModuleId id, ImportRecordId record) {
  auto& records = output_.metas[id.value].namespace_records;
  for (ImportRecordId existing : records) {
    if (existing == record) {
      return;
    }
  }
  records.push_back(record);
}

void LinkStage::DetermineWrapKinds() {
  auto& module_graph = output_.graph;

  // Modules without module syntax take the kind of their first use.
  for (ModuleId id : output_.sorted_modules) {
    for (const auto& record : module_graph[id].import_records) {
      auto& target = module_graph[record.resolved_module];
      switch (record.kind) {
        case ImportKind::kRequire:
          if (target.exports_kind == ExportsKind::kNone) {
            target.exports_kind = ExportsKind::kCommonJs;
          }
          Wrap(
              target.id, target.exports_kind == ExportsKind::kCommonJs
                             ? WrapKind::kCjs
                             : WrapKind::kEsm);
          if (target.exports_kind == ExportsKind::kEsm) {
            output_.metas[target.id.value].needs_namespace_object = true;
          }
          break;
        case ImportKind::kImport:
          if (target.exports_kind == ExportsKind::kNone) {
            target.exports_kind = ExportsKind::kEsm;
          }
          if (target.exports_kind == ExportsKind::kCommonJs) {
            Wrap(target.id, WrapKind::kCjs);
          }
          break;
        case ImportKind::kDynamicImport:
          if (target.exports_kind == ExportsKind::kNone) {
            target.exports_kind = ExportsKind::kEsm;
          }
          if (target.exports_kind == ExportsKind::kCommonJs) {
            Wrap(target.id, WrapKind::kCjs);
          }
          break;
      }
    }
  }

  // An ES module entry needs no wrapper, but a CommonJS one does when the
  // output has no `module` object.
  if (output_.format == OutputFormat::kEsm) {
    for (const auto& entry : module_graph.entries) {
      const auto& module = module_graph[entry.module];
      if (module.exports_kind == ExportsKind::kCommonJs) {
        Wrap(entry.module, WrapKind::kCjs);
      }
    }
  }

  // Everything an ESM-wrapped module imports must initialize lazily too,
  // or it would run before the wrapper is called.
  std::vector<ModuleId> worklist;
  for (ModuleId id : output_.sorted_modules) {
    if (output_.metas[id.value].wrap_kind == WrapKind::kEsm) {
      worklist.push_back(id);
    }
  }
  while (!worklist.empty()) {
    ModuleId id = worklist.back();
    worklist.pop_back();
    for (const auto& record : module_graph[id].import_records) {
      if (record.kind != ImportKind::kImport) {
        continue;
      }
      ModuleId dep = record.resolved_module;
      auto& meta = output_.metas[dep.value];
      if (meta.wrap_kind == WrapKind::kNone &&
          module_graph[dep].exports_kind == ExportsKind::kEsm &&
          dep != module_graph.runtime) {
        meta.wrap_kind = WrapKind::kEsm;
        worklist.push_back(dep);
      }
    }
  }
}

// An ES module export statement can only name a variable, so an entry may
// not re-export a CommonJS binding, which lives on a namespace object.
void LinkStage::CheckEntryExports() {
  if (output_.format != OutputFormat::kEsm) {
    return;
  }
  const auto& module_graph = output_.graph;
  for (const auto& entry : module_graph.entries) {
    const auto& module = module_graph[entry.module];
    for (const auto& [name, ref] :
         output_.metas[entry.module.value].resolved_exports) {
      SymbolRef root = module_graph.symbols.Root(ref);
      if (module_graph.symbols.Get(root).namespace_alias) {
        sink_.Report(
            Diagnostic::Error(
                module.pretty_path,
                fmt::format(
                    "entry module cannot re-export \"{}\" of a CommonJS "
                    "module in ES module output",
                    name))
                .WithNote("import the binding and export a local copy"));
      }
    }
  }
}

void LinkStage::DeclareWrappers() {
  auto& module_graph = output_.graph;
  for (ModuleId id : output_.sorted_modules) {
    auto& meta = output_.metas[id.value];
    std::string stem =
        common::LegalIdentifierFromPath(module_graph[id].pretty_path);
    switch (meta.wrap_kind) {
      case WrapKind::kNone:
        break;
      case WrapKind::kCjs:
        meta.wrapper_ref =
            module_graph.symbols.Declare(id, "require_" + stem);
        break;
      case WrapKind::kEsm:
        meta.wrapper_ref = module_graph.symbols.Declare(id, "init_" + stem);
        break;
    }
  }
}

}  // namespace weld::link
