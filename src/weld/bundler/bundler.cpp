#include "weld/bundler/bundler.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "weld/chunk/deconflict.hpp"
#include "weld/chunk/file_name_template.hpp"
#include "weld/render/render_chunk.hpp"

namespace weld::bundler {

Bundler::Bundler(
    BundlerOptions options, scan::FileSystem& fs,
    std::vector<std::unique_ptr<scan::Plugin>> plugins)
    : options_(std::move(options)),
      fs_(fs),
      plugin_driver_(std::move(plugins)),
      resolver_(fs, options_.output.cwd),
      pool_(options_.threads),
      renderer_(std::make_unique<render::DefaultModuleRenderer>()) {
}

void Bundler::SetModuleRenderer(
    std::unique_ptr<render::ModuleRenderer> renderer) {
  renderer_ = std::move(renderer);
}

auto Bundler::Scan() -> BatchResult<graph::ModuleGraph> {
  return scan::ScanStage(
             plugin_driver_, resolver_, fs_, pool_, options_.output.cwd)
      .Scan(options_.input);
}

auto Bundler::Link(graph::ModuleGraph module_graph)
    -> BatchResult<link::LinkStageOutput> {
  return link::LinkStage(std::move(module_graph), options_.output.format)
      .Link();
}

auto Bundler::GenerateChunks(const link::LinkStageOutput& link)
    -> chunk::ChunkGraph {
  chunk::ChunkGraph chunk_graph = chunk::GenerateChunks(link);
  chunk::ComputeCrossChunkLinks(chunk_graph, link);
  for (auto& chunk : chunk_graph.chunks) {
    chunk::DeconflictChunkSymbols(chunk, link);
  }
  chunk::AssignFileNames(
      chunk_graph, chunk::FileNameTemplate(options_.output.entry_file_names),
      chunk::FileNameTemplate(options_.output.chunk_file_names));
  return chunk_graph;
}

auto Bundler::Render(
    const chunk::ChunkGraph& chunk_graph, const link::LinkStageOutput& link)
    -> BatchResult<std::vector<OutputChunk>> {
  std::vector<OutputChunk> chunks;
  BatchedErrors errors;
  for (const auto& chunk : chunk_graph.chunks) {
    auto rendered = render::RenderChunk(
        chunk, options_.output, link, chunk_graph, *renderer_, pool_);
    if (!rendered) {
      errors.Merge(std::move(rendered.error()));
      continue;
    }
    OutputChunk output{
        .file_name = std::move(rendered->preliminary_filename),
        .code = std::move(rendered->code),
        .map = std::move(rendered->map),
        .rendered_chunk = std::move(rendered->rendered_chunk)};
    if (output.map) {
      std::string base =
          std::filesystem::path(output.file_name).filename().string();
      output.map->SetFile(base);
      output.code += fmt::format("//# sourceMappingURL={}.map\n", base);
    }
    chunks.push_back(std::move(output));
  }
  if (!errors.IsEmpty()) {
    return std::unexpected(std::move(errors));
  }
  return chunks;
}

auto Bundler::Generate() -> BatchResult<BundleOutput> {
  auto module_graph = Scan();
  if (!module_graph) {
    return std::unexpected(std::move(module_graph.error()));
  }
  auto link = Link(std::move(*module_graph));
  if (!link) {
    return std::unexpected(std::move(link.error()));
  }
  chunk::ChunkGraph chunk_graph = GenerateChunks(*link);
  auto chunks = Render(chunk_graph, *link);
  if (!chunks) {
    return std::unexpected(std::move(chunks.error()));
  }
  std::vector<Diagnostic> warnings = std::move(link->warnings);
  warnings.insert(
      warnings.end(), chunk_graph.warnings.begin(),
      chunk_graph.warnings.end());
  return BundleOutput{
      .chunks = std::move(*chunks), .warnings = std::move(warnings)};
}

auto Bundler::WriteChunks(const std::vector<OutputChunk>& chunks)
    -> BatchResult<void> {
  std::filesystem::path out_dir = options_.output.cwd / options_.output.dir;
  BatchedErrors errors;
  for (const auto& chunk : chunks) {
    std::filesystem::path path = out_dir / chunk.file_name;
    if (auto written = fs_.WriteFile(path, chunk.code); !written) {
      errors.Push(std::move(written.error()));
    }
    if (chunk.map) {
      std::filesystem::path map_path = path;
      map_path += ".map";
      if (auto written = fs_.WriteFile(map_path, chunk.map->ToJson());
          !written) {
        errors.Push(std::move(written.error()));
      }
    }
  }
  if (!errors.IsEmpty()) {
    return std::unexpected(std::move(errors));
  }
  return {};
}

auto Bundler::Write() -> BatchResult<BundleOutput> {
  auto output = Generate();
  if (!output) {
    return output;
  }
  if (auto written = WriteChunks(output->chunks); !written) {
    return std::unexpected(std::move(written.error()));
  }
  return output;
}

}  // namespace weld::bundler
