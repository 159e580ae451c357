#include "weld/scan/scan_stage.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "absl/container/flat_hash_map.h"
#include "weld/common/path_utils.hpp"
#include "weld/frontend/module_scanner.hpp"
#include "weld/scan/load_source.hpp"
#include "weld/scan/runtime_module.hpp"

namespace weld::scan {

namespace {

struct PendingModule {
  ModuleId id;
  ResolvedPath path;
};

struct LoadedModule {
  std::string source;
  frontend::ScanResult scan;
};

// Maps scanner record indices to indices into the resolved record list.
// std::nullopt marks a record that failed to resolve and was dropped.
using RecordRemap = std::vector<std::optional<uint32_t>>;

auto Remap(const RecordRemap& remap, ImportRecordId id)
    -> std::optional<ImportRecordId> {
  if (id.value >= remap.size() || !remap[id.value]) {
    return std::nullopt;
  }
  return ImportRecordId{*remap[id.value]};
}

void ApplyRemap(
    const RecordRemap& remap, frontend::ScanResult& scan,
    graph::Module& module) {
  for (auto& named : scan.named_imports) {
    if (auto record = Remap(remap, named.record)) {
      named.record = *record;
      module.named_imports.push_back(std::move(named));
    }
  }
  for (auto& re_export : scan.re_exports) {
    if (auto record = Remap(remap, re_export.record)) {
      re_export.record = *record;
      module.re_exports.push_back(std::move(re_export));
    }
  }
  for (auto star : scan.star_exports) {
    if (auto record = Remap(remap, star)) {
      module.star_exports.push_back(*record);
    }
  }
  for (auto& statement : scan.ast.statements) {
    for (auto& piece : statement.pieces) {
      if (auto* require = std::get_if<graph::RequirePiece>(&piece)) {
        if (auto record = Remap(remap, require->record)) {
          require->record = *record;
        }
      } else if (auto* dynamic =
                     std::get_if<graph::DynamicImportPiece>(&piece)) {
        if (auto record = Remap(remap, dynamic->record)) {
          dynamic->record = *record;
        } else {
          piece = graph::TextPiece{std::move(dynamic->text)};
        }
      }
    }
  }
}

}  // namespace

auto ScanStage::ResolveId(
    std::string_view importer, std::string_view specifier,
    graph::ImportKind kind) const -> Result<std::optional<ResolvedPath>> {
  auto hooked = plugin_driver_.ResolveId(
      HookResolveIdArgs{
          .importer = importer, .specifier = specifier, .kind = kind});
  if (!hooked) {
    return std::unexpected(std::move(hooked.error()));
  }
  if (*hooked) {
    return ResolvedPath{
        .path = std::move((*hooked)->id), .ignored = (*hooked)->ignored};
  }
  return resolver_.Resolve(importer, specifier, kind);
}

auto ScanStage::Scan(const std::vector<InputItem>& inputs)
    -> BatchResult<graph::ModuleGraph> {
  graph::ModuleGraph module_graph;
  BatchedErrors errors;
  absl::flat_hash_map<std::string, ModuleId> module_by_path;
  std::vector<PendingModule> wave;

  auto discover = [&](const ResolvedPath& path) -> ModuleId {
    auto [it, inserted] = module_by_path.try_emplace(
        path.path,
        ModuleId{static_cast<uint32_t>(module_graph.modules.size())});
    if (inserted) {
      graph::Module module;
      module.id = it->second;
      module.resource_id = path.path;
      module.pretty_path = common::PrettyPath(path.path, cwd_);
      module.namespace_ref = SymbolRef{.owner = it->second, .symbol = 0};
      module_graph.modules.push_back(std::move(module));
      wave.push_back(PendingModule{.id = it->second, .path = path});
    }
    return it->second;
  };

  module_graph.runtime = discover(ResolvedPath{.path = RuntimeModuleId()});

  for (const auto& input : inputs) {
    auto resolved = ResolveId("", input.import, graph::ImportKind::kImport);
    if (!resolved) {
      errors.Push(std::move(resolved.error()));
      continue;
    }
    if (!*resolved) {
      errors.Push(Diagnostic::Error(
          input.import,
          fmt::format("Could not resolve entry module \"{}\"", input.import)));
      continue;
    }
    ModuleId id = discover(**resolved);
    bool duplicate = std::ranges::any_of(
        module_graph.entries,
        [&](const auto& entry) { return entry.module == id; });
    if (!duplicate) {
      module_graph.entries.push_back(
          graph::EntryPoint{.name = input.name, .module = id});
    }
  }
  if (module_graph.entries.empty() && errors.IsEmpty()) {
    errors.Push(Diagnostic::HostError("no entry points given"));
  }

  while (!wave.empty()) {
    std::vector<PendingModule> current = std::move(wave);
    wave.clear();

    auto loaded = pool_.Map(
        current.size(), [&](size_t i) -> BatchResult<LoadedModule> {
          const PendingModule& pending = current[i];
          const std::string& pretty_path = module_graph[pending.id].pretty_path;
          std::string source;
          if (pending.id == module_graph.runtime) {
            source = std::string(RuntimeSource());
          } else {
            auto text = LoadSource(plugin_driver_, pending.path, fs_);
            if (!text) {
              return std::unexpected(std::move(text.error()));
            }
            source = std::move(*text);
          }
          auto scanned = frontend::ScanModule(pending.id, source, pretty_path);
          if (!scanned) {
            return std::unexpected(BatchedErrors(std::move(scanned.error())));
          }
          return LoadedModule{
              .source = std::move(source), .scan = std::move(*scanned)};
        });

    for (size_t i = 0; i < current.size(); ++i) {
      if (!loaded[i]) {
        errors.Merge(std::move(loaded[i].error()));
        continue;
      }
      ModuleId id = current[i].id;
      // Copies: discovering a module may reallocate the module table.
      std::string importer = module_graph[id].resource_id;
      std::string pretty_path = module_graph[id].pretty_path;
      auto& scan = loaded[i]->scan;

      std::vector<graph::ImportRecord> records;
      RecordRemap remap;
      for (auto& raw : scan.import_records) {
        auto resolved = ResolveId(importer, raw.module_request, raw.kind);
        if (!resolved) {
          errors.Push(std::move(resolved.error()));
          remap.emplace_back(std::nullopt);
          continue;
        }
        if (!*resolved) {
          // Dynamic imports that fail stay runtime-resolved.
          if (raw.IsStatic()) {
            errors.Push(Diagnostic::Unresolved(
                pretty_path, raw.module_request, graph::ToString(raw.kind)));
          }
          remap.emplace_back(std::nullopt);
          continue;
        }
        ModuleId target = discover(**resolved);
        remap.emplace_back(static_cast<uint32_t>(records.size()));
        records.push_back(std::move(raw).IntoImportRecord(target));
      }

      for (auto& name : scan.symbol_names) {
        module_graph.symbols.Declare(id, std::move(name));
      }

      graph::Module& module = module_graph[id];
      module.source = std::move(loaded[i]->source);
      module.exports_kind = scan.exports_kind;
      module.import_records = std::move(records);
      ApplyRemap(remap, scan, module);
      module.ast = std::move(scan.ast);
      module.local_exports = std::move(scan.local_exports);
      module.unresolved_references = std::move(scan.unresolved_references);
    }
  }

  if (!errors.IsEmpty()) {
    return std::unexpected(std::move(errors));
  }
  return module_graph;
}

}  // namespace weld::scan
