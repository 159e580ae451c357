#pragma once

#include <string>
#include <string_view>

#include "absl/container/flat_hash_set.h"
#include "weld/chunk/chunk.hpp"
#include "weld/link/link_stage.hpp"

namespace weld::chunk {

// Hands out identifiers unique within one scope: a taken base name gets the
// first free `$1`, `$2`, ... suffix. JavaScript reserved words and common
// globals start out taken.
class Renamer {
 public:
  Renamer();

  void Reserve(std::string_view name);
  auto Assign(std::string_view base) -> std::string;

  [[nodiscard]] auto IsTaken(std::string_view name) const -> bool {
    return used_.contains(absl::string_view(name.data(), name.size()));
  }

 private:
  absl::flat_hash_set<std::string> used_;
};

// Fills chunk.canonical_names: the symbols each member module declares, in
// execution order and then by local index, followed by the cross-chunk
// imports in import order. Identifiers the member modules use without
// declaring them are never handed out.
void DeconflictChunkSymbols(Chunk& chunk, const link::LinkStageOutput& link);

}  // namespace weld::chunk
