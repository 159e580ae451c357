#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "weld/bundler/bundler.hpp"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/common/internal_error.hpp"
#include "weld/common/output_format.hpp"
#include "weld/link/link_stage.hpp"
#include "weld/scan/file_system.hpp"

namespace weld::chunk {
namespace {

class CodeSplittingTest : public ::testing::Test {
 protected:
  struct Entry {
    std::string import;
    std::optional<std::string> name;
  };

  // Scans and links `entries`; GenerateChunks and ComputeCrossChunkLinks are
  // left to the test.
  auto LinkEntries(
      const std::vector<Entry>& entries,
      OutputFormat format = OutputFormat::kEsm) -> link::LinkStageOutput {
    bundler::BundlerOptions options;
    for (const auto& entry : entries) {
      options.input.push_back(
          scan::InputItem{.name = entry.name, .import = entry.import});
    }
    options.output.cwd = "/p";
    options.output.format = format;
    options.threads = 2;
    bundler::Bundler bundler(std::move(options), fs_);
    auto module_graph = bundler.Scan();
    EXPECT_TRUE(module_graph.has_value());
    auto link = bundler.Link(std::move(*module_graph));
    EXPECT_TRUE(link.has_value());
    return std::move(*link);
  }

  auto Split(
      const std::vector<Entry>& entries,
      OutputFormat format = OutputFormat::kEsm) -> ChunkGraph {
    link_ = LinkEntries(entries, format);
    ChunkGraph chunk_graph = GenerateChunks(link_);
    ComputeCrossChunkLinks(chunk_graph, link_);
    return chunk_graph;
  }

  auto Id(std::string_view pretty) const -> ModuleId {
    for (const auto& module : link_.graph.modules) {
      if (module.pretty_path == pretty) {
        return module.id;
      }
    }
    ADD_FAILURE() << "no module " << pretty;
    return ModuleId{0};
  }

  auto Symbol(std::string_view pretty, std::string_view name) const
      -> SymbolRef {
    ModuleId id = Id(pretty);
    for (uint32_t i = 0; i < link_.graph.symbols.SymbolCount(id); ++i) {
      SymbolRef ref{.owner = id, .symbol = i};
      if (link_.graph.symbols.Get(ref).name == name) {
        return ref;
      }
    }
    ADD_FAILURE() << "no symbol " << name << " in " << pretty;
    return SymbolRef{.owner = id, .symbol = 0};
  }

  auto Modules(const Chunk& chunk) const -> std::vector<std::string> {
    std::vector<std::string> paths;
    for (ModuleId id : chunk.modules) {
      paths.push_back(link_.graph[id].pretty_path);
    }
    return paths;
  }

  static auto Aliases(const Chunk& chunk) -> std::vector<std::string> {
    std::vector<std::string> aliases;
    for (const auto& item : chunk.exports) {
      aliases.push_back(item.alias);
    }
    return aliases;
  }

  scan::MemoryFileSystem fs_;
  link::LinkStageOutput link_;
};

// =============================================================================
// Chunk Assignment Tests
// =============================================================================

TEST_F(CodeSplittingTest, SingleEntryMakesOneChunk) {
  fs_.AddFile("/p/a.js", "import './b.js';\n");
  fs_.AddFile("/p/b.js", "globalThis.b = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 1);
  const Chunk& chunk = chunk_graph.chunks[0];
  EXPECT_TRUE(chunk.IsEntry());
  EXPECT_EQ(*chunk.entry_module, Id("a.js"));
  EXPECT_EQ(chunk.name, "a");
  EXPECT_EQ(Modules(chunk), (std::vector<std::string>{"b.js", "a.js"}));
  EXPECT_TRUE(chunk.imports_from_other_chunks.empty());
}

TEST_F(CodeSplittingTest, UnusedRuntimeBelongsToNoChunk) {
  fs_.AddFile("/p/a.js", "export const a = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}});
  EXPECT_FALSE(chunk_graph.module_to_chunk[link_.graph.runtime.value]);
  EXPECT_THROW(
      (void)chunk_graph.ChunkOf(link_.graph.runtime), common::InternalError);
}

TEST_F(CodeSplittingTest, RuntimeJoinsChunkThatUsesIt) {
  fs_.AddFile("/p/a.js", "import lib from './lib.js';\nconsole.log(lib);\n");
  fs_.AddFile("/p/lib.js", "module.exports = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 1);
  EXPECT_EQ(
      Modules(chunk_graph.chunks[0]),
      (std::vector<std::string>{"weld:runtime", "lib.js", "a.js"}));
}

TEST_F(CodeSplittingTest, GrowingOneEntryLeavesOtherEntriesAlone) {
  fs_.AddFile("/p/a.js", "import './a_only.js';\nimport './shared.js';\n");
  fs_.AddFile("/p/a_only.js", "globalThis.a = 1;\n");
  fs_.AddFile("/p/b.js", "import './shared.js';\n");
  fs_.AddFile("/p/shared.js", "globalThis.s = 1;\n");
  auto before = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(before.chunks.size(), 3);
  auto a_before = Modules(before.chunks[0]);
  auto shared_before = Modules(before.chunks[2]);
  EXPECT_EQ(a_before, (std::vector<std::string>{"a_only.js", "a.js"}));
  EXPECT_EQ(Modules(before.chunks[1]), (std::vector<std::string>{"b.js"}));

  fs_.AddFile("/p/b.js", "import './shared.js';\nimport './b_only.js';\n");
  fs_.AddFile("/p/b_only.js", "globalThis.b = 1;\n");
  auto after = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(after.chunks.size(), 3);
  EXPECT_EQ(Modules(after.chunks[0]), a_before);
  EXPECT_EQ(Modules(after.chunks[2]), shared_before);
  EXPECT_EQ(
      Modules(after.chunks[1]),
      (std::vector<std::string>{"b_only.js", "b.js"}));
}

TEST_F(CodeSplittingTest, SharedModuleGetsCommonChunk) {
  fs_.AddFile("/p/a.js", "import './shared.js';\n");
  fs_.AddFile("/p/b.js", "import './shared.js';\n");
  fs_.AddFile("/p/shared.js", "globalThis.s = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 3);
  EXPECT_EQ(chunk_graph.chunks[0].name, "a");
  EXPECT_EQ(chunk_graph.chunks[1].name, "b");

  const Chunk& common = chunk_graph.chunks[2];
  EXPECT_FALSE(common.IsEntry());
  EXPECT_EQ(common.name, "shared");
  EXPECT_TRUE(common.bits.HasBit(0));
  EXPECT_TRUE(common.bits.HasBit(1));
  EXPECT_EQ(Modules(common), (std::vector<std::string>{"shared.js"}));
  EXPECT_TRUE(chunk_graph.warnings.empty());
  EXPECT_EQ(chunk_graph.ChunkOf(Id("shared.js")), ChunkId{2});
}

TEST_F(CodeSplittingTest, ModulesWithEqualReachabilityShareChunk) {
  fs_.AddFile("/p/a.js", "import './one.js';\n");
  fs_.AddFile("/p/b.js", "import './one.js';\n");
  fs_.AddFile("/p/one.js", "import './two.js';\n");
  fs_.AddFile("/p/two.js", "globalThis.two = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 3);
  EXPECT_EQ(chunk_graph.chunks[2].name, "two");
  EXPECT_EQ(
      Modules(chunk_graph.chunks[2]),
      (std::vector<std::string>{"two.js", "one.js"}));
}

TEST_F(CodeSplittingTest, EntriesImportingEachOtherShareChunk) {
  fs_.AddFile("/p/a.js", "import './b.js';\n");
  fs_.AddFile("/p/b.js", "import './a.js';\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 1);
  EXPECT_EQ(*chunk_graph.chunks[0].entry_module, Id("a.js"));
  EXPECT_EQ(
      Modules(chunk_graph.chunks[0]),
      (std::vector<std::string>{"b.js", "a.js"}));
  ASSERT_EQ(chunk_graph.warnings.size(), 1);
  EXPECT_EQ(chunk_graph.warnings[0].primary.location, "b.js");
  EXPECT_EQ(
      chunk_graph.warnings[0].primary.message,
      "entry shares chunk \"a\" with entry \"a.js\" and gets no output "
      "file of its own");
}

TEST_F(CodeSplittingTest, EntryImportedByAnotherEntryKeepsItsChunk) {
  fs_.AddFile("/p/a.js", "import { b } from './b.js';\nconsole.log(b);\n");
  fs_.AddFile("/p/b.js", "export const b = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 2);
  EXPECT_EQ(chunk_graph.ChunkOf(Id("b.js")), ChunkId{1});

  const auto& imports = chunk_graph.chunks[0].imports_from_other_chunks;
  ASSERT_EQ(imports.size(), 1);
  EXPECT_EQ(imports[0].chunk, ChunkId{1});
  ASSERT_EQ(imports[0].items.size(), 1);
  EXPECT_EQ(imports[0].items[0].export_alias, "b");
  // The entry's own export already names the binding.
  EXPECT_EQ(Aliases(chunk_graph.chunks[1]), (std::vector<std::string>{"b"}));
}

TEST_F(CodeSplittingTest, NamedEntryKeepsItsName) {
  fs_.AddFile("/p/src/index.js", "globalThis.x = 1;\n");
  auto chunk_graph = Split({{.import = "src/index.js", .name = "main"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 1);
  EXPECT_EQ(chunk_graph.chunks[0].name, "main");
}

TEST_F(CodeSplittingTest, DynamicImportTargetJoinsImportersChunk) {
  fs_.AddFile("/p/a.js", "import('./lazy.js');\n");
  fs_.AddFile("/p/lazy.js", "globalThis.lazy = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 1);
  EXPECT_EQ(
      Modules(chunk_graph.chunks[0]),
      (std::vector<std::string>{"weld:runtime", "lazy.js", "a.js"}));
}

// =============================================================================
// Cross-Chunk Link Tests
// =============================================================================

TEST_F(CodeSplittingTest, SharedBindingIsExportedAndImported) {
  fs_.AddFile("/p/a.js", "import { s } from './shared.js';\nconsole.log(s);\n");
  fs_.AddFile("/p/b.js", "import { s } from './shared.js';\nconsole.log(s);\n");
  fs_.AddFile("/p/shared.js", "export const s = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 3);
  SymbolRef s = Symbol("shared.js", "s");

  const Chunk& common = chunk_graph.chunks[2];
  ASSERT_EQ(common.exports.size(), 1);
  EXPECT_EQ(common.exports[0].symbol, s);
  EXPECT_EQ(common.exports[0].alias, "s");

  for (uint32_t i : {0U, 1U}) {
    const auto& imports = chunk_graph.chunks[i].imports_from_other_chunks;
    ASSERT_EQ(imports.size(), 1);
    EXPECT_EQ(imports[0].chunk, ChunkId{2});
    ASSERT_EQ(imports[0].items.size(), 1);
    EXPECT_EQ(imports[0].items[0].import_ref, s);
    EXPECT_EQ(imports[0].items[0].export_alias, "s");
  }
}

TEST_F(CodeSplittingTest, SideEffectImportStillOrdersChunks) {
  fs_.AddFile("/p/a.js", "import './shared.js';\n");
  fs_.AddFile("/p/b.js", "import './shared.js';\n");
  fs_.AddFile("/p/shared.js", "globalThis.s = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  const auto& imports = chunk_graph.chunks[0].imports_from_other_chunks;
  ASSERT_EQ(imports.size(), 1);
  EXPECT_EQ(imports[0].chunk, ChunkId{2});
  EXPECT_TRUE(imports[0].items.empty());
  EXPECT_TRUE(chunk_graph.chunks[2].exports.empty());
}

TEST_F(CodeSplittingTest, CollidingExportAliasesGetSuffixes) {
  const char* importer =
      "import { x } from './one.js';\nimport { x as y } from './two.js';\n"
      "console.log(x, y);\n";
  fs_.AddFile("/p/a.js", importer);
  fs_.AddFile("/p/b.js", importer);
  fs_.AddFile("/p/one.js", "export const x = 1;\n");
  fs_.AddFile("/p/two.js", "export const x = 2;\n");
  auto chunk_graph = Split({{.import = "a.js"}, {.import = "b.js"}});
  ASSERT_EQ(chunk_graph.chunks.size(), 3);
  EXPECT_EQ(
      Aliases(chunk_graph.chunks[2]), (std::vector<std::string>{"x", "x$1"}));
  EXPECT_EQ(
      chunk_graph.chunks[2].ExportAliasOf(Symbol("two.js", "x")), "x$1");
}

TEST_F(CodeSplittingTest, EntryExportsUseExportedNames) {
  fs_.AddFile("/p/a.js", "const v = 1;\nexport { v as value };\n");
  auto chunk_graph = Split({{.import = "a.js"}});
  EXPECT_EQ(
      Aliases(chunk_graph.chunks[0]), (std::vector<std::string>{"value"}));
}

TEST_F(CodeSplittingTest, CommonJsEntryHasNoNamedExports) {
  fs_.AddFile("/p/a.js", "module.exports = { value: 1 };\n");
  auto chunk_graph = Split({{.import = "a.js"}});
  EXPECT_TRUE(chunk_graph.chunks[0].exports.empty());
}

TEST_F(CodeSplittingTest, AppFormatHasNoExports) {
  fs_.AddFile("/p/a.js", "export const value = 1;\n");
  auto chunk_graph = Split({{.import = "a.js"}}, OutputFormat::kApp);
  EXPECT_TRUE(chunk_graph.chunks[0].exports.empty());
}

}  // namespace
}  // namespace weld::chunk
