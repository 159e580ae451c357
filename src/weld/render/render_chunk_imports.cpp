#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "weld/common/internal_error.hpp"
#include "weld/common/path_utils.hpp"
#include "weld/render/chunk_glue.hpp"
#include "weld/render/js_syntax.hpp"

namespace weld::render {

namespace {

auto ExportAliasOf(const chunk::CrossChunkImportItem& item)
    -> const std::string& {
  if (!item.export_alias) {
    common::ThrowInternalError(
        "RenderChunkImports",
        fmt::format(
            "cross-chunk import of symbol (module {}, index {}) has no "
            "export alias",
            item.import_ref.owner.value, item.import_ref.symbol));
  }
  return *item.export_alias;
}

auto FileNameOf(const chunk::Chunk& chunk) -> const std::string& {
  if (!chunk.preliminary_filename) {
    common::ThrowInternalError(
        "RenderChunkImports",
        "chunk file name must be assigned before rendering");
  }
  return *chunk.preliminary_filename;
}

}  // namespace

auto RenderChunkImports(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link,
    const chunk::ChunkGraph& chunk_graph, const OutputOptions& options)
    -> std::string {
  if (options.format == OutputFormat::kApp) {
    return {};
  }
  const auto& symbols = link.graph.symbols;
  std::vector<std::string> statements;

  for (const auto& imports : chunk.imports_from_other_chunks) {
    std::string specifier = QuoteString(
        common::ImportSpecifierBetween(
            FileNameOf(chunk), FileNameOf(chunk_graph[imports.chunk])));

    std::vector<std::string> specifiers;
    for (const auto& item : imports.items) {
      const std::string& alias = ExportAliasOf(item);
      const std::string& local =
          symbols.CanonicalNameFor(item.import_ref, chunk.canonical_names);
      if (options.format == OutputFormat::kEsm) {
        specifiers.push_back(
            fmt::format(
                "{} as {}",
                IsIdentifierName(alias) ? alias : QuoteString(alias), local));
      } else {
        specifiers.push_back(fmt::format("{}: {}", PropertyKey(alias), local));
      }
    }

    switch (options.format) {
      case OutputFormat::kEsm:
        statements.push_back(
            specifiers.empty()
                ? fmt::format("import {};", specifier)
                : fmt::format(
                      "import {{ {} }} from {};", fmt::join(specifiers, ", "),
                      specifier));
        break;
      case OutputFormat::kCjs:
        statements.push_back(
            specifiers.empty()
                ? fmt::format("require({});", specifier)
                : fmt::format(
                      "const {{ {} }} = require({});",
                      fmt::join(specifiers, ", "), specifier));
        break;
      case OutputFormat::kApp:
        break;
    }
  }
  return fmt::format("{}", fmt::join(statements, "\n"));
}

}  // namespace weld::render
