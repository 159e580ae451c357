#pragma once

#include <optional>
#include <string>

#include "weld/chunk/chunk.hpp"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/link/link_stage.hpp"
#include "weld/render/output_options.hpp"

namespace weld::render {

// One import statement per chunk `chunk` depends on, in discovery order.
// Empty for the app format and for chunks without dependencies.
auto RenderChunkImports(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link,
    const chunk::ChunkGraph& chunk_graph, const OutputOptions& options)
    -> std::string;

// The chunk's export statement(s), or std::nullopt when it exports nothing
// or the format has no export surface.
auto RenderChunkExports(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link,
    const OutputOptions& options) -> std::optional<std::string>;

}  // namespace weld::render
