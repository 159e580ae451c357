#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld::sourcemap {

// One segment of a generated line. Indices point into the map's sources and
// names tables.
struct Mapping {
  uint32_t generated_column = 0;
  uint32_t source = 0;
  uint32_t original_line = 0;
  uint32_t original_column = 0;
  std::optional<uint32_t> name;

  auto operator==(const Mapping&) const -> bool = default;
};

// Decoded mappings, one vector per generated line.
using MappingLines = std::vector<std::vector<Mapping>>;

// Source map revision 3.
class SourceMap {
 public:
  SourceMap() = default;
  SourceMap(
      std::vector<std::string> sources,
      std::vector<std::optional<std::string>> sources_content,
      std::vector<std::string> names, MappingLines lines)
      : sources_(std::move(sources)),
        sources_content_(std::move(sources_content)),
        names_(std::move(names)),
        lines_(std::move(lines)) {
  }

  static auto FromJson(std::string_view json) -> Result<SourceMap>;

  [[nodiscard]] auto ToJson() const -> std::string;

  // Base64 VLQ `mappings` field.
  [[nodiscard]] auto EncodeMappings() const -> std::string;

  [[nodiscard]] auto GetFile() const -> const std::optional<std::string>& {
    return file_;
  }
  void SetFile(std::string file) {
    file_ = std::move(file);
  }

  [[nodiscard]] auto GetSources() const -> const std::vector<std::string>& {
    return sources_;
  }
  void SetSources(std::vector<std::string> sources) {
    sources_ = std::move(sources);
  }

  [[nodiscard]] auto GetSourcesContent() const
      -> const std::vector<std::optional<std::string>>& {
    return sources_content_;
  }
  [[nodiscard]] auto GetNames() const -> const std::vector<std::string>& {
    return names_;
  }
  [[nodiscard]] auto GetLines() const -> const MappingLines& {
    return lines_;
  }

 private:
  std::optional<std::string> file_;
  std::vector<std::string> sources_;
  std::vector<std::optional<std::string>> sources_content_;
  std::vector<std::string> names_;
  MappingLines lines_;
};

// Appends the Base64 VLQ encoding of `value`.
void EncodeVlq(int64_t value, std::string& out);

// Parses a `mappings` field.
auto DecodeMappings(std::string_view mappings) -> Result<MappingLines>;

}  // namespace weld::sourcemap
