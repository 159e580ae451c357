#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "weld/chunk/chunk.hpp"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/common/worker_pool.hpp"
#include "weld/link/link_stage.hpp"
#include "weld/render/module_renderer.hpp"
#include "weld/render/output_options.hpp"
#include "weld/render/rendered_chunk.hpp"
#include "weld/sourcemap/source_map.hpp"

namespace weld::render {

struct ChunkRenderReturn {
  std::string code;
  // Sources are relative to file_dir.
  std::optional<sourcemap::SourceMap> map;
  RenderedChunk rendered_chunk;
  // Absolute directory the chunk file lands in.
  std::filesystem::path file_dir;
  std::string preliminary_filename;
};

// Produces the final text and source map of one chunk:
//
//   1. cross-chunk imports
//   2. every member module, rendered on `pool`, each after a
//      `// <pretty path>` line
//   3. `"use strict";` for CommonJS output when every module is strict
//   4. the entry wrapper call for ES module output
//   5. the export block
//   6. the footer, then the banner, both called on this thread
//
// Module render and hook failures come back as batched errors; a chunk
// without a file name or parent directory is an internal error.
auto RenderChunk(
    const chunk::Chunk& chunk, const OutputOptions& options,
    const link::LinkStageOutput& link, const chunk::ChunkGraph& chunk_graph,
    const ModuleRenderer& renderer, common::WorkerPool& pool)
    -> BatchResult<ChunkRenderReturn>;

}  // namespace weld::render
