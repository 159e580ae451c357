#include <algorithm>
#include <cstdint>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "absl/container/flat_hash_set.h"
#include "weld/common/internal_error.hpp"
#include "weld/common/overloaded.hpp"
#include "weld/graph/module.hpp"
#include "weld/link/link_stage.hpp"

namespace weld::link {

using graph::ImportKind;

// Records what the module's rendered output declares and which symbols of
// other modules it names, including runtime helpers and wrapper functions
// the renderer emits around and before the module's code.
void LinkStage::CollectReferences(ModuleId id) {
  auto& module_graph = output_.graph;
  const graph::Module& module = module_graph[id];
  auto& meta = output_.metas[id.value];
  const auto& symbols = module_graph.symbols;

  absl::flat_hash_set<SymbolRef> seen;
  bool uses_runtime = false;
  auto reference = [&](SymbolRef ref) {
    SymbolRef root = symbols.Root(ref);
    // An alias is never declared; the output names its namespace variable.
    if (const auto& alias = symbols.Get(root).namespace_alias) {
      root = symbols.Root(alias->namespace_ref);
    }
    if (root.owner != id && seen.insert(root).second) {
      meta.referenced_symbols.push_back(root);
    }
  };
  auto use_helper = [&](std::string_view name) {
    reference(output_.RuntimeHelper(name));
    uses_runtime = true;
  };
  auto wrapper_of = [&](ModuleId target) {
    const auto& wrapper = output_.metas[target.value].wrapper_ref;
    if (!wrapper) {
      common::ThrowInternalError(
          "LinkStage::CollectReferences",
          fmt::format(
              "module '{}' is used through a wrapper but has none",
              module_graph[target].pretty_path));
    }
    return *wrapper;
  };

  switch (meta.wrap_kind) {
    case WrapKind::kNone:
      break;
    case WrapKind::kCjs:
      use_helper("__commonJS");
      break;
    case WrapKind::kEsm:
      use_helper("__esm");
      break;
  }

  if (meta.needs_namespace_object) {
    use_helper("__export");
    for (const auto& [name, ref] : meta.resolved_exports) {
      reference(ref);
    }
  }

  // Import preamble: namespace variables of CommonJS imports, then wrapper
  // calls for every other wrapped static import.
  if (!meta.namespace_records.empty()) {
    use_helper("__toESM");
  }
  for (const auto& record : module.import_records) {
    if (record.kind != ImportKind::kImport) {
      continue;
    }
    if (output_.metas[record.resolved_module.value].IsWrapped()) {
      reference(wrapper_of(record.resolved_module));
    }
  }

  for (const auto& statement : module.ast.statements) {
    for (const auto& piece : statement.pieces) {
      std::visit(
          common::Overloaded{
              [](const graph::TextPiece&) {},
              [&](const graph::SymbolPiece& symbol) {
                reference(SymbolRef{.owner = id, .symbol = symbol.local});
              },
              [&](const graph::RequirePiece& require) {
                ModuleId target =
                    module.import_records[require.record.value].resolved_module;
                reference(wrapper_of(target));
                if (output_.metas[target.value].wrap_kind == WrapKind::kEsm) {
                  use_helper("__toCommonJS");
                  reference(module_graph[target].namespace_ref);
                }
              },
              [&](const graph::DynamicImportPiece& dynamic) {
                ModuleId target =
                    module.import_records[dynamic.record.value].resolved_module;
                if (output_.metas[target.value].IsWrapped()) {
                  reference(wrapper_of(target));
                }
                if (module_graph[target].exports_kind ==
                    graph::ExportsKind::kCommonJs) {
                  use_helper("__toESM");
                } else {
                  reference(module_graph[target].namespace_ref);
                }
              },
          },
          piece);
    }
  }

  if (uses_runtime && id != module_graph.runtime) {
    meta.dependencies.push_back(module_graph.runtime);
  }

  // Declarations: the namespace object, every statement binding, namespace
  // variables of CommonJS imports and the wrapper, ordered by local index.
  absl::flat_hash_set<SymbolRef> declared;
  auto declare = [&](SymbolRef ref) {
    if (declared.insert(ref).second) {
      meta.declared_symbols.push_back(ref);
    }
  };
  if (meta.needs_namespace_object) {
    declare(module.namespace_ref);
  }
  for (const auto& statement : module.ast.statements) {
    for (uint32_t local : statement.declared) {
      declare(SymbolRef{.owner = id, .symbol = local});
    }
  }
  for (ImportRecordId record : meta.namespace_records) {
    declare(module.import_records[record.value].namespace_ref);
  }
  if (meta.wrapper_ref) {
    declare(*meta.wrapper_ref);
  }
  std::ranges::sort(meta.declared_symbols);
}

}  // namespace weld::link
