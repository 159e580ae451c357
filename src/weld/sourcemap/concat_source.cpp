#include "weld/sourcemap/concat_source.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"

namespace weld::sourcemap {

namespace {

auto CountLines(const std::string& text) -> size_t {
  return static_cast<size_t>(std::ranges::count(text, '\n')) + 1;
}

// Index of `value` in `table`, appending it on first sight.
auto Intern(
    absl::flat_hash_map<std::string, uint32_t>& index,
    std::vector<std::string>& table, const std::string& value) -> uint32_t {
  auto [it, inserted] =
      index.try_emplace(value, static_cast<uint32_t>(table.size()));
  if (inserted) {
    table.push_back(value);
  }
  return it->second;
}

}  // namespace

auto ConcatSource::Content() const -> std::string {
  std::string out;
  for (size_t i = 0; i < sources_.size(); ++i) {
    if (i > 0) {
      out += '\n';
    }
    out += sources_[i]->Content();
  }
  return out;
}

auto ConcatSource::ContentAndSourcemap() const
    -> std::pair<std::string, std::optional<SourceMap>> {
  std::string content = Content();
  bool has_map = std::ranges::any_of(
      sources_, [](const auto& source) { return source->Map() != nullptr; });
  if (!has_map) {
    return {std::move(content), std::nullopt};
  }

  std::vector<std::string> sources;
  std::vector<std::optional<std::string>> sources_content;
  std::vector<std::string> names;
  absl::flat_hash_map<std::string, uint32_t> source_index;
  absl::flat_hash_map<std::string, uint32_t> name_index;
  MappingLines lines;

  for (const auto& piece : sources_) {
    size_t line_offset = lines.size();
    size_t piece_lines = CountLines(piece->Content());
    lines.resize(line_offset + piece_lines);

    const SourceMap* map = piece->Map();
    if (map == nullptr) {
      continue;
    }

    std::vector<uint32_t> source_remap;
    for (size_t i = 0; i < map->GetSources().size(); ++i) {
      const std::string& path = map->GetSources()[i];
      size_t before = sources.size();
      uint32_t index = Intern(source_index, sources, path);
      if (sources.size() != before) {
        const auto& contents = map->GetSourcesContent();
        sources_content.push_back(
            i < contents.size() ? contents[i] : std::nullopt);
      }
      source_remap.push_back(index);
    }
    std::vector<uint32_t> name_remap;
    for (const auto& name : map->GetNames()) {
      name_remap.push_back(Intern(name_index, names, name));
    }

    const auto& piece_mappings = map->GetLines();
    size_t count = std::min(piece_mappings.size(), piece_lines);
    for (size_t line = 0; line < count; ++line) {
      for (Mapping mapping : piece_mappings[line]) {
        if (mapping.source >= source_remap.size()) {
          continue;
        }
        mapping.source = source_remap[mapping.source];
        if (mapping.name) {
          mapping.name = *mapping.name < name_remap.size()
                             ? std::optional(name_remap[*mapping.name])
                             : std::nullopt;
        }
        lines[line_offset + line].push_back(mapping);
      }
    }
  }

  return {
      std::move(content),
      SourceMap(
          std::move(sources), std::move(sources_content), std::move(names),
          std::move(lines))};
}

}  // namespace weld::sourcemap
