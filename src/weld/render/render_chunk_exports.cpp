#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "weld/render/chunk_glue.hpp"
#include "weld/render/js_syntax.hpp"

namespace weld::render {

namespace {

// An exported CommonJS binding of a CommonJS module reads through its
// namespace variable.
auto ReadExpression(
    SymbolRef ref, const chunk::Chunk& chunk, const graph::SymbolTable& symbols)
    -> std::string {
  SymbolRef root = symbols.Root(ref);
  if (const auto& alias = symbols.Get(root).namespace_alias) {
    return ReadExpression(alias->namespace_ref, chunk, symbols) +
           PropertyAccess(alias->property);
  }
  return symbols.CanonicalNameFor(root, chunk.canonical_names);
}

}  // namespace

auto RenderChunkExports(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link,
    const OutputOptions& options) -> std::optional<std::string> {
  if (chunk.exports.empty()) {
    return std::nullopt;
  }
  const auto& symbols = link.graph.symbols;

  switch (options.format) {
    case OutputFormat::kEsm: {
      std::vector<std::string> specifiers;
      for (const auto& item : chunk.exports) {
        specifiers.push_back(
            fmt::format(
                "{} as {}",
                symbols.CanonicalNameFor(item.symbol, chunk.canonical_names),
                IsIdentifierName(item.alias) ? item.alias
                                             : QuoteString(item.alias)));
      }
      return fmt::format("export {{ {} }};", fmt::join(specifiers, ", "));
    }
    case OutputFormat::kCjs: {
      // Getters keep the bindings live.
      std::vector<std::string> lines;
      for (const auto& item : chunk.exports) {
        lines.push_back(
            fmt::format(
                "Object.defineProperty(exports, {}, {{ enumerable: true, get: "
                "function () {{ return {}; }} }});",
                QuoteString(item.alias),
                ReadExpression(item.symbol, chunk, symbols)));
      }
      return fmt::format("{}", fmt::join(lines, "\n"));
    }
    case OutputFormat::kApp:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace weld::render
