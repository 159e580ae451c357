#include "weld/render/render_chunk.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "weld/common/internal_error.hpp"
#include "weld/common/path_utils.hpp"
#include "weld/graph/module.hpp"
#include "weld/render/chunk_glue.hpp"
#include "weld/sourcemap/concat_source.hpp"

namespace weld::render {

namespace {

using sourcemap::RawSource;
using sourcemap::SourceMapSource;

auto CallAddon(
    const AddonHook& hook, const RenderedChunk& rendered_chunk)
    -> Result<std::optional<std::string>> {
  if (!hook) {
    return std::nullopt;
  }
  auto text = hook(rendered_chunk);
  if (!text) {
    return std::unexpected(std::move(text.error()));
  }
  if (*text && (*text)->empty()) {
    return std::nullopt;
  }
  return text;
}

auto AllModulesStrict(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link) -> bool {
  for (ModuleId id : chunk.modules) {
    const graph::Module& module = link.graph[id];
    if (module.exports_kind != graph::ExportsKind::kEsm &&
        !module.ast.contains_use_strict) {
      return false;
    }
  }
  return true;
}

}  // namespace

auto RenderChunk(
    const chunk::Chunk& chunk, const OutputOptions& options,
    const link::LinkStageOutput& link, const chunk::ChunkGraph& chunk_graph,
    const ModuleRenderer& renderer, common::WorkerPool& pool)
    -> BatchResult<ChunkRenderReturn> {
  if (!chunk.preliminary_filename) {
    common::ThrowInternalError(
        "RenderChunk", "chunk file name must be assigned before rendering");
  }
  const std::string& preliminary_filename = *chunk.preliminary_filename;

  sourcemap::ConcatSource concat_source;
  std::string imports =
      RenderChunkImports(chunk, link, chunk_graph, options);
  if (!imports.empty()) {
    concat_source.AddSource(std::make_unique<RawSource>(std::move(imports)));
  }

  auto outputs = pool.Map(chunk.modules.size(), [&](size_t i) {
    return renderer.Render(
        ModuleRenderContext{
            .module = link.graph[chunk.modules[i]],
            .chunk = chunk,
            .link = link,
            .chunk_graph = chunk_graph,
            .options = options});
  });

  BatchedErrors errors;
  std::map<std::string, RenderedModule> rendered_modules;
  for (auto& output : outputs) {
    if (!output) {
      errors.Push(std::move(output.error()));
      continue;
    }
    if (!*output) {
      continue;
    }
    ModuleRenderOutput& module = **output;
    concat_source.AddSource(
        std::make_unique<RawSource>(
            fmt::format("// {}", module.module_pretty_path)));
    if (module.sourcemap) {
      concat_source.AddSource(
          std::make_unique<SourceMapSource>(
              std::move(module.rendered_content),
              std::move(*module.sourcemap)));
    } else {
      concat_source.AddSource(
          std::make_unique<RawSource>(std::move(module.rendered_content)));
    }
    // Virtual ids are not file names; hooks never see them.
    if (!common::IsVirtualPath(module.module_path)) {
      rendered_modules.emplace(
          std::move(module.module_path), std::move(module.rendered_module));
    }
  }
  if (!errors.IsEmpty()) {
    return std::unexpected(std::move(errors));
  }

  RenderedChunk rendered_chunk = GenerateRenderedChunk(
      chunk, link, std::move(rendered_modules), chunk_graph);

  if (options.format == OutputFormat::kCjs && AllModulesStrict(chunk, link)) {
    concat_source.PrependSource(
        std::make_unique<RawSource>("\"use strict\";"));
  }

  if (chunk.entry_module && options.format == OutputFormat::kEsm) {
    const auto& meta = link.Meta(*chunk.entry_module);
    if (meta.IsWrapped()) {
      if (!meta.wrapper_ref) {
        common::ThrowInternalError(
            "RenderChunk",
            fmt::format(
                "wrapped entry '{}' has no wrapper symbol",
                link.graph[*chunk.entry_module].pretty_path));
      }
      const std::string& wrapper = link.graph.symbols.CanonicalNameFor(
          *meta.wrapper_ref, chunk.canonical_names);
      switch (meta.wrap_kind) {
        case link::WrapKind::kEsm:
          concat_source.AddSource(
              std::make_unique<RawSource>(fmt::format("{}();", wrapper)));
          break;
        case link::WrapKind::kCjs:
          concat_source.AddSource(
              std::make_unique<RawSource>(
                  fmt::format("export default {}();\n", wrapper)));
          break;
        case link::WrapKind::kNone:
          break;
      }
    }
  }

  if (auto exports = RenderChunkExports(chunk, link, options)) {
    concat_source.AddSource(std::make_unique<RawSource>(std::move(*exports)));
  }

  auto footer = CallAddon(options.footer, rendered_chunk);
  if (!footer) {
    return std::unexpected(BatchedErrors(std::move(footer.error())));
  }
  if (*footer) {
    concat_source.AddSource(std::make_unique<RawSource>(std::move(**footer)));
  }

  // Prepended last: a hashbang must stay ahead of the strict directive.
  auto banner = CallAddon(options.banner, rendered_chunk);
  if (!banner) {
    return std::unexpected(BatchedErrors(std::move(banner.error())));
  }
  if (*banner) {
    concat_source.PrependSource(
        std::make_unique<RawSource>(std::move(**banner)));
  }

  auto [content, map] = concat_source.ContentAndSourcemap();

  // The file name may contain directories, so the chunk's directory is the
  // parent of the full path rather than the output directory.
  std::filesystem::path file_path =
      options.cwd / options.dir / preliminary_filename;
  std::filesystem::path file_dir = file_path.parent_path();
  if (file_dir.empty()) {
    common::ThrowInternalError(
        "RenderChunk",
        fmt::format(
            "chunk file path '{}' has no parent directory",
            file_path.string()));
  }

  if (map) {
    std::vector<std::string> sources;
    for (const auto& source : map->GetSources()) {
      sources.push_back(common::RelativePath(source, file_dir));
    }
    map->SetSources(std::move(sources));
  }

  if (content.empty() || content.back() != '\n') {
    content += '\n';
  }
  return ChunkRenderReturn{
      .code = std::move(content),
      .map = std::move(map),
      .rendered_chunk = std::move(rendered_chunk),
      .file_dir = std::move(file_dir),
      .preliminary_filename = preliminary_filename};
}

}  // namespace weld::render
