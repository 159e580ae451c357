#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "weld/chunk/chunk.hpp"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/graph/module.hpp"
#include "weld/link/link_stage.hpp"
#include "weld/render/output_options.hpp"
#include "weld/render/rendered_chunk.hpp"
#include "weld/sourcemap/source_map.hpp"

namespace weld::render {

struct ModuleRenderContext {
  const graph::Module& module;
  // The chunk the module belongs to; its canonical names are the only ones
  // the module may use.
  const chunk::Chunk& chunk;
  const link::LinkStageOutput& link;
  const chunk::ChunkGraph& chunk_graph;
  const OutputOptions& options;
};

struct ModuleRenderOutput {
  std::string module_path;
  std::string module_pretty_path;
  RenderedModule rendered_module;
  std::string rendered_content;
  std::optional<sourcemap::SourceMap> sourcemap;
  size_t lines_count = 0;
};

// Turns one linked module into its text inside a chunk. Called concurrently
// for the modules of a chunk, so implementations must not mutate shared
// state. std::nullopt means the module renders to nothing.
class ModuleRenderer {
 public:
  ModuleRenderer() = default;
  virtual ~ModuleRenderer() = default;
  ModuleRenderer(const ModuleRenderer&) = delete;
  auto operator=(const ModuleRenderer&) -> ModuleRenderer& = delete;
  ModuleRenderer(ModuleRenderer&&) = delete;
  auto operator=(ModuleRenderer&&) -> ModuleRenderer& = delete;

  [[nodiscard]] virtual auto Render(const ModuleRenderContext& context) const
      -> Result<std::optional<ModuleRenderOutput>> = 0;
};

// Prints the scanned statements with canonical names, plus the interop code
// linking asked for: the namespace object, the import prologue and the
// CommonJS or lazy-ESM wrapper. Maps every output line back to the first
// column of its source line.
class DefaultModuleRenderer final : public ModuleRenderer {
 public:
  [[nodiscard]] auto Render(const ModuleRenderContext& context) const
      -> Result<std::optional<ModuleRenderOutput>> override;
};

}  // namespace weld::render
