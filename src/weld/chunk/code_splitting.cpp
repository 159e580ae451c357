#include <cstdint>
#include <optional>
#include <vector>

#include <fmt/core.h>

#include "absl/container/flat_hash_map.h"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/common/bitset.hpp"
#include "weld/common/internal_error.hpp"
#include "weld/common/path_utils.hpp"

namespace weld::chunk {

namespace {

// Sets `bit` on every module reachable from `entry`.
void MarkReachable(
    const link::LinkStageOutput& link, ModuleId entry, uint32_t bit,
    std::vector<common::BitSet>& bits) {
  std::vector<ModuleId> stack{entry};
  while (!stack.empty()) {
    ModuleId id = stack.back();
    stack.pop_back();
    if (bits[id.value].HasBit(bit)) {
      continue;
    }
    bits[id.value].SetBit(bit);
    for (const auto& record : link.graph[id].import_records) {
      stack.push_back(record.resolved_module);
    }
    for (ModuleId dep : link.Meta(id).dependencies) {
      stack.push_back(dep);
    }
  }
}

}  // namespace

auto ChunkGraph::ChunkOf(ModuleId module) const -> ChunkId {
  if (module.value >= module_to_chunk.size() ||
      !module_to_chunk[module.value]) {
    common::ThrowInternalError(
        "ChunkGraph::ChunkOf",
        fmt::format("module {} belongs to no chunk", module.value));
  }
  return *module_to_chunk[module.value];
}

auto GenerateChunks(const link::LinkStageOutput& link) -> ChunkGraph {
  const auto& module_graph = link.graph;
  auto entry_count = static_cast<uint32_t>(module_graph.entries.size());

  std::vector<common::BitSet> bits(
      module_graph.ModuleCount(), common::BitSet(entry_count));
  for (uint32_t i = 0; i < entry_count; ++i) {
    MarkReachable(link, module_graph.entries[i].module, i, bits);
  }

  ChunkGraph chunk_graph;
  chunk_graph.module_to_chunk.resize(module_graph.ModuleCount());
  absl::flat_hash_map<common::BitSet, ChunkId> chunk_by_bits;

  auto new_chunk = [&](const common::BitSet& key) -> Chunk& {
    ChunkId id{static_cast<uint32_t>(chunk_graph.chunks.size())};
    chunk_by_bits.emplace(key, id);
    chunk_graph.chunks.emplace_back().bits = key;
    return chunk_graph.chunks.back();
  };

  // Entries whose bitsets coincide (they import each other) share the first
  // one's chunk.
  for (const auto& entry : module_graph.entries) {
    const auto& key = bits[entry.module.value];
    if (auto it = chunk_by_bits.find(key); it != chunk_by_bits.end()) {
      const Chunk& owner = chunk_graph[it->second];
      chunk_graph.warnings.push_back(Diagnostic::Warning(
          module_graph[entry.module].pretty_path,
          fmt::format(
              "entry shares chunk \"{}\" with entry \"{}\" and gets no "
              "output file of its own",
              owner.name.value_or("chunk"),
              module_graph[*owner.entry_module].pretty_path)));
      continue;
    }
    Chunk& chunk = new_chunk(key);
    chunk.entry_module = entry.module;
    chunk.name = entry.name.has_value()
                     ? *entry.name
                     : common::ChunkNameFromPath(
                           module_graph[entry.module].resource_id);
  }

  for (ModuleId id : link.sorted_modules) {
    const auto& key = bits[id.value];
    if (key.IsEmpty()) {
      continue;
    }
    auto it = chunk_by_bits.find(key);
    ChunkId chunk_id;
    if (it != chunk_by_bits.end()) {
      chunk_id = it->second;
    } else {
      chunk_id = ChunkId{static_cast<uint32_t>(chunk_graph.chunks.size())};
      Chunk& chunk = new_chunk(key);
      chunk.name = common::ChunkNameFromPath(module_graph[id].resource_id);
    }
    chunk_graph[chunk_id].modules.push_back(id);
    chunk_graph.module_to_chunk[id.value] = chunk_id;
  }
  return chunk_graph;
}

}  // namespace weld::chunk
