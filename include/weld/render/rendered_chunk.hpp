#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "weld/chunk/chunk.hpp"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/link/link_stage.hpp"

namespace weld::render {

// What one module contributed to a chunk.
struct RenderedModule {
  std::string code;

  [[nodiscard]] auto RenderedLength() const -> size_t {
    return code.size();
  }
};

// Read-only summary of a chunk handed to the banner and footer hooks.
struct RenderedChunk {
  std::optional<std::string> name;
  std::string file_name;
  bool is_entry = false;
  // Resource id of the entry module, for entry chunks.
  std::optional<std::string> facade_module_id;
  // Member modules in execution order, virtual modules excluded.
  std::vector<std::string> module_ids;
  // Aliases the chunk exports, in export order.
  std::vector<std::string> exports;
  // File names of the chunks this one imports, in import order.
  std::vector<std::string> imports;
  // Keyed by resource id.
  std::map<std::string, RenderedModule> modules;
};

auto GenerateRenderedChunk(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link,
    std::map<std::string, RenderedModule> rendered_modules,
    const chunk::ChunkGraph& chunk_graph) -> RenderedChunk;

}  // namespace weld::render
