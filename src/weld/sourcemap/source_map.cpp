#include "weld/sourcemap/source_map.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace weld::sourcemap {

namespace {

constexpr std::string_view kBase64 =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int kVlqShift = 5;
constexpr int kVlqContinuation = 1 << kVlqShift;
constexpr int kVlqMask = kVlqContinuation - 1;

auto Base64Value(char c) -> int {
  auto pos = kBase64.find(c);
  return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

auto MappingError(std::string_view detail) -> Diagnostic {
  return Diagnostic::HostError(fmt::format("invalid source map: {}", detail));
}

}  // namespace

void EncodeVlq(int64_t value, std::string& out) {
  // Sign goes into the lowest bit.
  uint64_t vlq = value < 0 ? (static_cast<uint64_t>(-value) << 1U) | 1U
                           : static_cast<uint64_t>(value) << 1U;
  do {
    auto digit = static_cast<int>(vlq & kVlqMask);
    vlq >>= kVlqShift;
    if (vlq != 0) {
      digit |= kVlqContinuation;
    }
    out += kBase64[digit];
  } while (vlq != 0);
}

auto DecodeMappings(std::string_view mappings) -> Result<MappingLines> {
  MappingLines lines(1);
  // Every field except the generated column is relative to the previous
  // segment across lines.
  int64_t source = 0;
  int64_t original_line = 0;
  int64_t original_column = 0;
  int64_t name = 0;

  size_t pos = 0;
  auto read_vlq = [&](int64_t& value) -> bool {
    uint64_t result = 0;
    int shift = 0;
    while (true) {
      if (pos >= mappings.size()) {
        return false;
      }
      int digit = Base64Value(mappings[pos++]);
      if (digit < 0 || shift > 60) {
        return false;
      }
      result |= static_cast<uint64_t>(digit & kVlqMask) << shift;
      if ((digit & kVlqContinuation) == 0) {
        break;
      }
      shift += kVlqShift;
    }
    auto magnitude = static_cast<int64_t>(result >> 1U);
    value = (result & 1U) != 0 ? -magnitude : magnitude;
    return true;
  };
  auto at_segment_end = [&]() {
    return pos >= mappings.size() || mappings[pos] == ',' ||
           mappings[pos] == ';';
  };

  int64_t generated_column = 0;
  while (pos < mappings.size()) {
    char c = mappings[pos];
    if (c == ';') {
      lines.emplace_back();
      generated_column = 0;
      ++pos;
      continue;
    }
    if (c == ',') {
      ++pos;
      continue;
    }

    int64_t delta = 0;
    if (!read_vlq(delta)) {
      return std::unexpected(MappingError("truncated segment"));
    }
    generated_column += delta;
    if (at_segment_end()) {
      // Segments without a source carry no position for us.
      continue;
    }
    int64_t source_delta = 0;
    int64_t line_delta = 0;
    int64_t column_delta = 0;
    if (!read_vlq(source_delta) || !read_vlq(line_delta) ||
        !read_vlq(column_delta)) {
      return std::unexpected(MappingError("truncated segment"));
    }
    source += source_delta;
    original_line += line_delta;
    original_column += column_delta;

    Mapping mapping{
        .generated_column = static_cast<uint32_t>(generated_column),
        .source = static_cast<uint32_t>(source),
        .original_line = static_cast<uint32_t>(original_line),
        .original_column = static_cast<uint32_t>(original_column),
        .name = std::nullopt};
    if (!at_segment_end()) {
      int64_t name_delta = 0;
      if (!read_vlq(name_delta)) {
        return std::unexpected(MappingError("truncated segment"));
      }
      name += name_delta;
      mapping.name = static_cast<uint32_t>(name);
    }
    if (generated_column < 0 || source < 0 || original_line < 0 ||
        original_column < 0 || name < 0) {
      return std::unexpected(MappingError("negative position"));
    }
    lines.back().push_back(mapping);
  }
  return lines;
}

auto SourceMap::EncodeMappings() const -> std::string {
  std::string out;
  int64_t source = 0;
  int64_t original_line = 0;
  int64_t original_column = 0;
  int64_t name = 0;
  for (size_t line = 0; line < lines_.size(); ++line) {
    if (line > 0) {
      out += ';';
    }
    int64_t generated_column = 0;
    bool first = true;
    for (const auto& mapping : lines_[line]) {
      if (!first) {
        out += ',';
      }
      first = false;
      EncodeVlq(mapping.generated_column - generated_column, out);
      generated_column = mapping.generated_column;
      EncodeVlq(mapping.source - source, out);
      source = mapping.source;
      EncodeVlq(mapping.original_line - original_line, out);
      original_line = mapping.original_line;
      EncodeVlq(mapping.original_column - original_column, out);
      original_column = mapping.original_column;
      if (mapping.name) {
        EncodeVlq(*mapping.name - name, out);
        name = *mapping.name;
      }
    }
  }
  return out;
}

auto SourceMap::ToJson() const -> std::string {
  nlohmann::json j;
  j["version"] = 3;
  if (file_) {
    j["file"] = *file_;
  }
  j["sources"] = sources_;
  auto contents = nlohmann::json::array();
  for (const auto& content : sources_content_) {
    if (content) {
      contents.push_back(*content);
    } else {
      contents.push_back(nullptr);
    }
  }
  j["sourcesContent"] = std::move(contents);
  j["names"] = names_;
  j["mappings"] = EncodeMappings();
  return j.dump();
}

auto SourceMap::FromJson(std::string_view json) -> Result<SourceMap> {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json);
  } catch (const nlohmann::json::parse_error& e) {
    return std::unexpected(
        MappingError(fmt::format("JSON parse error: {}", e.what())));
  }

  if (!j.is_object() || j.value("version", 0) != 3) {
    return std::unexpected(MappingError("expected a version 3 object"));
  }
  if (!j.contains("mappings") || !j["mappings"].is_string()) {
    return std::unexpected(MappingError("missing mappings"));
  }

  SourceMap map;
  try {
    if (j.contains("file") && j["file"].is_string()) {
      map.file_ = j["file"].get<std::string>();
    }
    if (j.contains("sources")) {
      map.sources_ = j["sources"].get<std::vector<std::string>>();
    }
    if (j.contains("sourcesContent")) {
      for (const auto& content : j["sourcesContent"]) {
        if (content.is_string()) {
          map.sources_content_.emplace_back(content.get<std::string>());
        } else {
          map.sources_content_.emplace_back(std::nullopt);
        }
      }
    }
    if (j.contains("names")) {
      map.names_ = j["names"].get<std::vector<std::string>>();
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(MappingError(e.what()));
  }

  auto lines = DecodeMappings(j["mappings"].get<std::string>());
  if (!lines) {
    return std::unexpected(std::move(lines.error()));
  }
  map.lines_ = std::move(*lines);
  return map;
}

}  // namespace weld::sourcemap
