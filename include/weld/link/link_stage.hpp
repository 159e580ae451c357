#pragma once

#include <string_view>
#include <vector>

#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/diagnostic/diagnostic_sink.hpp"
#include "weld/common/ids.hpp"
#include "weld/common/output_format.hpp"
#include "weld/graph/module_graph.hpp"
#include "weld/link/linking_metadata.hpp"

namespace weld::link {

struct LinkStageOutput {
  graph::ModuleGraph graph;
  std::vector<LinkingMetadata> metas;  // Indexed by ModuleId
  // Every module reachable from an entry, in execution order.
  std::vector<ModuleId> sorted_modules;
  OutputFormat format = OutputFormat::kEsm;
  std::vector<Diagnostic> warnings;

  [[nodiscard]] auto Meta(ModuleId id) const -> const LinkingMetadata& {
    return metas[id.value];
  }

  // Symbol exported by the runtime module under `name`.
  [[nodiscard]] auto RuntimeHelper(std::string_view name) const -> SymbolRef;
};

// Links a scanned module graph: execution order, export kinds of untyped
// modules, wrap kinds, exports, import bindings and the cross-module
// references chunking needs.
class LinkStage {
 public:
  LinkStage(graph::ModuleGraph graph, OutputFormat format);

  auto Link() && -> BatchResult<LinkStageOutput>;

 private:
  void SortModules();
  void DetermineWrapKinds();
  void DeclareWrappers();
  void MarkNamespaceUses(ModuleId id);
  void ResolveExports(ModuleId id);
  void BindImports(ModuleId id);
  void CheckEntryExports();
  void CollectReferences(ModuleId id);

  void Wrap(ModuleId id, WrapKind kind);
  void AddNamespaceRecord(ModuleId id, ImportRecordId record);

  // Export-resolution state per module.
  enum class Visit : uint8_t { kNotStarted, kInProgress, kDone };

  LinkStageOutput output_;
  std::vector<Visit> export_state_;
  DiagnosticSink sink_;
};

}  // namespace weld::link
