#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/ids.hpp"
#include "weld/graph/import_record.hpp"
#include "weld/graph/module.hpp"

namespace weld::frontend {

// Everything the scan stage needs from one module's source. Local symbol
// indices refer to `symbol_names`; index 0 is the namespace object.
struct ScanResult {
  std::vector<std::string> symbol_names;
  std::vector<graph::RawImportRecord> import_records;
  graph::ModuleAst ast;
  std::vector<graph::NamedImport> named_imports;
  std::vector<graph::LocalExport> local_exports;
  std::vector<graph::ReExport> re_exports;
  std::vector<ImportRecordId> star_exports;
  std::vector<std::string> unresolved_references;
  graph::ExportsKind exports_kind = graph::ExportsKind::kNone;
};

// Splits `source` into top-level statements and extracts the module's import
// and export surface. `id` owns the namespace refs of the returned import
// records; `path` names the module in diagnostics and seeds synthesized
// identifiers.
auto ScanModule(ModuleId id, std::string_view source, std::string_view path)
    -> Result<ScanResult>;

}  // namespace weld::frontend
