#pragma once

#include <optional>
#include <vector>

#include "weld/chunk/chunk.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/ids.hpp"
#include "weld/link/link_stage.hpp"

namespace weld::chunk {

// Owns every chunk and the module -> chunk map. Frozen once cross-chunk
// links and canonical names are computed; rendering only reads it.
struct ChunkGraph {
  // Entry chunks in entry order, then common chunks.
  std::vector<Chunk> chunks;
  // Indexed by ModuleId; empty for modules no entry reaches.
  std::vector<std::optional<ChunkId>> module_to_chunk;
  // Entries folded into another entry's chunk.
  std::vector<Diagnostic> warnings;

  [[nodiscard]] auto operator[](ChunkId id) const -> const Chunk& {
    return chunks[id.value];
  }
  [[nodiscard]] auto operator[](ChunkId id) -> Chunk& {
    return chunks[id.value];
  }

  // Chunk of a module that must have one.
  [[nodiscard]] auto ChunkOf(ModuleId module) const -> ChunkId;
};

// Partitions the linked modules by reachability: each entry owns one bit, a
// module's bitset is the union of the bits of every entry that reaches it
// through any import record or link dependency, and modules with equal
// bitsets share a chunk.
auto GenerateChunks(const link::LinkStageOutput& link) -> ChunkGraph;

// Fills imports_from_other_chunks and exports for every chunk. Entry chunks
// export their entry module's exports under the exported names; symbols used
// across chunks are exported under their own name, deduplicated per chunk
// as `x`, `x$1`, ...
void ComputeCrossChunkLinks(
    ChunkGraph& chunk_graph, const link::LinkStageOutput& link);

}  // namespace weld::chunk
