#include "weld/graph/import_record.hpp"

#include <utility>

#include <fmt/core.h>

#include "weld/common/internal_error.hpp"

namespace weld::graph {

auto RawImportRecord::IntoImportRecord(ModuleId resolved_module) &&
    -> ImportRecord {
  if (!resolved_module.IsValid()) {
    common::ThrowInternalError(
        "RawImportRecord::IntoImportRecord",
        fmt::format(
            "import of \"{}\" converted without a resolved module",
            module_request));
  }
  return ImportRecord{
      .module_request = std::move(module_request),
      .resolved_module = resolved_module,
      .kind = kind,
      .namespace_ref = namespace_ref,
      .contains_import_star = contains_import_star,
      .contains_import_default = contains_import_default,
      .contains_import_named = contains_import_named,
  };
}

}  // namespace weld::graph
