#pragma once

#include <optional>
#include <string>
#include <utility>

#include "weld/chunk/chunk_graph.hpp"

namespace weld::chunk {

// Output file name pattern such as "[name].js" or "chunks/[name].mjs".
class FileNameTemplate {
 public:
  explicit FileNameTemplate(std::string pattern)
      : pattern_(std::move(pattern)) {
  }

  // Every `[name]` replaced by `name`, or by "chunk" when there is none.
  [[nodiscard]] auto Render(const std::optional<std::string>& name) const
      -> std::string;

  [[nodiscard]] auto Pattern() const -> const std::string& {
    return pattern_;
  }

 private:
  std::string pattern_;
};

// Gives every chunk its preliminary file name, entry chunks from
// `entry_template` and the others from `chunk_template`, in chunk order. A
// name already taken gets 2, 3, ... appended to its stem.
void AssignFileNames(
    ChunkGraph& chunk_graph, const FileNameTemplate& entry_template,
    const FileNameTemplate& chunk_template);

}  // namespace weld::chunk
