#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "weld/sourcemap/source_map.hpp"

namespace weld::sourcemap {

// A piece of generated text, optionally carrying the map of where its lines
// came from.
class Source {
 public:
  Source() = default;
  virtual ~Source() = default;
  Source(const Source&) = delete;
  auto operator=(const Source&) -> Source& = delete;
  Source(Source&&) = delete;
  auto operator=(Source&&) -> Source& = delete;

  [[nodiscard]] virtual auto Content() const -> const std::string& = 0;
  [[nodiscard]] virtual auto Map() const -> const SourceMap* = 0;
};

class RawSource final : public Source {
 public:
  explicit RawSource(std::string content) : content_(std::move(content)) {
  }

  [[nodiscard]] auto Content() const -> const std::string& override {
    return content_;
  }
  [[nodiscard]] auto Map() const -> const SourceMap* override {
    return nullptr;
  }

 private:
  std::string content_;
};

class SourceMapSource final : public Source {
 public:
  SourceMapSource(std::string content, SourceMap map)
      : content_(std::move(content)), map_(std::move(map)) {
  }

  [[nodiscard]] auto Content() const -> const std::string& override {
    return content_;
  }
  [[nodiscard]] auto Map() const -> const SourceMap* override {
    return &map_;
  }

 private:
  std::string content_;
  SourceMap map_;
};

// Pieces joined with "\n". The composite map shifts each piece's mappings
// down by the lines before it and merges the sources and names tables in
// first-appearance order.
class ConcatSource {
 public:
  void AddSource(std::unique_ptr<Source> source) {
    sources_.push_back(std::move(source));
  }
  void PrependSource(std::unique_ptr<Source> source) {
    sources_.insert(sources_.begin(), std::move(source));
  }

  [[nodiscard]] auto IsEmpty() const -> bool {
    return sources_.empty();
  }

  [[nodiscard]] auto Content() const -> std::string;

  // The joined text and, if any piece carries a map, the composite map.
  [[nodiscard]] auto ContentAndSourcemap() const
      -> std::pair<std::string, std::optional<SourceMap>>;

 private:
  std::vector<std::unique_ptr<Source>> sources_;
};

}  // namespace weld::sourcemap
