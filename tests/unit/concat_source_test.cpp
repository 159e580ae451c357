#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "weld/sourcemap/concat_source.hpp"
#include "weld/sourcemap/source_map.hpp"

namespace weld::sourcemap {
namespace {

class ConcatSourceTest : public ::testing::Test {
 protected:
  // Maps every line of a piece to consecutive lines of `source`.
  static auto LineMap(
      const std::string& source, uint32_t first_line, uint32_t count)
      -> SourceMap {
    MappingLines lines;
    for (uint32_t i = 0; i < count; ++i) {
      lines.push_back(
          {Mapping{
              .generated_column = 0,
              .source = 0,
              .original_line = first_line + i,
              .original_column = 0,
              .name = std::nullopt}});
    }
    return SourceMap({source}, {"content of " + source}, {}, std::move(lines));
  }
};

TEST_F(ConcatSourceTest, PiecesAreJoinedWithNewlines) {
  ConcatSource concat;
  concat.AddSource(std::make_unique<RawSource>("a"));
  concat.AddSource(std::make_unique<RawSource>("b\nc"));
  concat.PrependSource(std::make_unique<RawSource>("top"));
  EXPECT_EQ(concat.Content(), "top\na\nb\nc");
}

TEST_F(ConcatSourceTest, NoMapWithoutMappedPieces) {
  ConcatSource concat;
  concat.AddSource(std::make_unique<RawSource>("a"));
  auto [content, map] = concat.ContentAndSourcemap();
  EXPECT_EQ(content, "a");
  EXPECT_FALSE(map.has_value());
}

TEST_F(ConcatSourceTest, MappingsShiftByPrecedingLines) {
  ConcatSource concat;
  concat.AddSource(std::make_unique<RawSource>("// header\n// more"));
  concat.AddSource(
      std::make_unique<SourceMapSource>("x\ny", LineMap("m.js", 0, 2)));
  concat.AddSource(std::make_unique<RawSource>("// between"));
  concat.AddSource(
      std::make_unique<SourceMapSource>("z", LineMap("m.js", 5, 1)));

  auto [content, map] = concat.ContentAndSourcemap();
  EXPECT_EQ(content, "// header\n// more\nx\ny\n// between\nz");
  ASSERT_TRUE(map.has_value());
  ASSERT_EQ(map->GetSources().size(), 1);
  EXPECT_EQ(map->GetSources()[0], "m.js");
  ASSERT_EQ(map->GetSourcesContent().size(), 1);
  EXPECT_EQ(map->GetSourcesContent()[0], "content of m.js");

  const auto& lines = map->GetLines();
  ASSERT_EQ(lines.size(), 6);
  EXPECT_TRUE(lines[0].empty());
  EXPECT_TRUE(lines[1].empty());
  ASSERT_EQ(lines[2].size(), 1);
  EXPECT_EQ(lines[2][0].original_line, 0);
  EXPECT_EQ(lines[3][0].original_line, 1);
  EXPECT_TRUE(lines[4].empty());
  ASSERT_EQ(lines[5].size(), 1);
  EXPECT_EQ(lines[5][0].original_line, 5);
  EXPECT_EQ(map->EncodeMappings(), ";;AAAA;AACA;;AAIA");
}

TEST_F(ConcatSourceTest, SourcesMergeInFirstAppearanceOrder) {
  ConcatSource concat;
  concat.AddSource(
      std::make_unique<SourceMapSource>("b", LineMap("b.js", 0, 1)));
  concat.AddSource(
      std::make_unique<SourceMapSource>("a", LineMap("a.js", 0, 1)));
  concat.AddSource(
      std::make_unique<SourceMapSource>("b2", LineMap("b.js", 3, 1)));

  auto [content, map] = concat.ContentAndSourcemap();
  ASSERT_TRUE(map.has_value());
  ASSERT_EQ(map->GetSources().size(), 2);
  EXPECT_EQ(map->GetSources()[0], "b.js");
  EXPECT_EQ(map->GetSources()[1], "a.js");
  EXPECT_EQ(map->GetLines()[1][0].source, 1);
  EXPECT_EQ(map->GetLines()[2][0].source, 0);
  EXPECT_EQ(map->GetLines()[2][0].original_line, 3);
}

TEST_F(ConcatSourceTest, MappingsBeyondPieceAreDropped) {
  ConcatSource concat;
  concat.AddSource(
      std::make_unique<SourceMapSource>("one line", LineMap("m.js", 0, 3)));
  concat.AddSource(std::make_unique<RawSource>("after"));
  auto [content, map] = concat.ContentAndSourcemap();
  ASSERT_TRUE(map.has_value());
  ASSERT_EQ(map->GetLines().size(), 2);
  EXPECT_TRUE(map->GetLines()[1].empty());
}

}  // namespace
}  // namespace weld::sourcemap
