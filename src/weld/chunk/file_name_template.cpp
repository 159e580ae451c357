#include "weld/chunk/file_name_template.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "absl/container/flat_hash_set.h"

namespace weld::chunk {

namespace {

constexpr std::string_view kNamePlaceholder = "[name]";

}  // namespace

auto FileNameTemplate::Render(const std::optional<std::string>& name) const
    -> std::string {
  std::string_view value = name ? std::string_view(*name) : "chunk";
  std::string out;
  size_t pos = 0;
  while (true) {
    size_t found = pattern_.find(kNamePlaceholder, pos);
    if (found == std::string::npos) {
      out.append(pattern_, pos, std::string::npos);
      return out;
    }
    out.append(pattern_, pos, found - pos);
    out.append(value);
    pos = found + kNamePlaceholder.size();
  }
}

void AssignFileNames(
    ChunkGraph& chunk_graph, const FileNameTemplate& entry_template,
    const FileNameTemplate& chunk_template) {
  absl::flat_hash_set<std::string> taken;
  for (auto& chunk : chunk_graph.chunks) {
    const auto& pattern = chunk.IsEntry() ? entry_template : chunk_template;
    std::string file = pattern.Render(chunk.name);
    if (taken.contains(file)) {
      std::filesystem::path path(file);
      std::string stem = (path.parent_path() / path.stem()).generic_string();
      std::string extension = path.extension().generic_string();
      for (uint32_t n = 2;; ++n) {
        std::string candidate = fmt::format("{}{}{}", stem, n, extension);
        if (!taken.contains(candidate)) {
          file = std::move(candidate);
          break;
        }
      }
    }
    taken.insert(file);
    chunk.preliminary_filename = std::move(file);
  }
}

}  // namespace weld::chunk
