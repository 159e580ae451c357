#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "weld/chunk/chunk_graph.hpp"
#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/worker_pool.hpp"
#include "weld/graph/module_graph.hpp"
#include "weld/link/link_stage.hpp"
#include "weld/render/module_renderer.hpp"
#include "weld/render/output_options.hpp"
#include "weld/render/rendered_chunk.hpp"
#include "weld/scan/file_system.hpp"
#include "weld/scan/plugin.hpp"
#include "weld/scan/resolver.hpp"
#include "weld/scan/scan_stage.hpp"
#include "weld/sourcemap/source_map.hpp"

namespace weld::bundler {

struct BundlerOptions {
  std::vector<scan::InputItem> input;
  render::OutputOptions output;
  // 0 picks the hardware concurrency.
  size_t threads = 0;
};

struct OutputChunk {
  // Relative to the output directory.
  std::string file_name;
  // Ends with the sourceMappingURL comment when a map is emitted.
  std::string code;
  std::optional<sourcemap::SourceMap> map;
  render::RenderedChunk rendered_chunk;
};

struct BundleOutput {
  // In chunk order: entry chunks in entry order, then common chunks.
  std::vector<OutputChunk> chunks;
  std::vector<Diagnostic> warnings;
};

// Runs the whole pipeline over one set of inputs. The stages are public so
// callers can time or inspect them one by one; Generate() chains them.
class Bundler {
 public:
  Bundler(
      BundlerOptions options, scan::FileSystem& fs,
      std::vector<std::unique_ptr<scan::Plugin>> plugins = {});

  // Replaces the per-module renderer (DefaultModuleRenderer by default).
  void SetModuleRenderer(std::unique_ptr<render::ModuleRenderer> renderer);

  auto Scan() -> BatchResult<graph::ModuleGraph>;
  auto Link(graph::ModuleGraph module_graph)
      -> BatchResult<link::LinkStageOutput>;
  // Chunks with cross-chunk links, canonical names and file names.
  auto GenerateChunks(const link::LinkStageOutput& link) -> chunk::ChunkGraph;
  auto Render(
      const chunk::ChunkGraph& chunk_graph, const link::LinkStageOutput& link)
      -> BatchResult<std::vector<OutputChunk>>;

  auto Generate() -> BatchResult<BundleOutput>;

  // Writes every chunk, and its map next to it, under the output directory.
  auto WriteChunks(const std::vector<OutputChunk>& chunks)
      -> BatchResult<void>;

  // Generate(), then WriteChunks().
  auto Write() -> BatchResult<BundleOutput>;

  [[nodiscard]] auto Options() const -> const BundlerOptions& {
    return options_;
  }

 private:
  BundlerOptions options_;
  scan::FileSystem& fs_;
  scan::PluginDriver plugin_driver_;
  scan::FsResolver resolver_;
  common::WorkerPool pool_;
  std::unique_ptr<render::ModuleRenderer> renderer_;
};

}  // namespace weld::bundler
