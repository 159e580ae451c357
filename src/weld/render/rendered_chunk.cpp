#include "weld/render/rendered_chunk.hpp"

#include <map>
#include <string>
#include <utility>

#include "weld/common/internal_error.hpp"
#include "weld/common/path_utils.hpp"

namespace weld::render {

auto GenerateRenderedChunk(
    const chunk::Chunk& chunk, const link::LinkStageOutput& link,
    std::map<std::string, RenderedModule> rendered_modules,
    const chunk::ChunkGraph& chunk_graph) -> RenderedChunk {
  if (!chunk.preliminary_filename) {
    common::ThrowInternalError(
        "GenerateRenderedChunk",
        "chunk file name must be assigned before rendering");
  }

  RenderedChunk rendered{
      .name = chunk.name,
      .file_name = *chunk.preliminary_filename,
      .is_entry = chunk.IsEntry(),
      .facade_module_id = std::nullopt,
      .module_ids = {},
      .exports = {},
      .imports = {},
      .modules = std::move(rendered_modules)};
  if (chunk.entry_module) {
    rendered.facade_module_id = link.graph[*chunk.entry_module].resource_id;
  }
  for (ModuleId id : chunk.modules) {
    const auto& resource_id = link.graph[id].resource_id;
    if (!common::IsVirtualPath(resource_id)) {
      rendered.module_ids.push_back(resource_id);
    }
  }
  for (const auto& item : chunk.exports) {
    rendered.exports.push_back(item.alias);
  }
  for (const auto& imports : chunk.imports_from_other_chunks) {
    const auto& source = chunk_graph[imports.chunk];
    if (source.preliminary_filename) {
      rendered.imports.push_back(*source.preliminary_filename);
    }
  }
  return rendered;
}

}  // namespace weld::render
