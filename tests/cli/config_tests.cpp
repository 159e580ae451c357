#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace weld::test {
namespace {

class ConfigTest : public CliTestFixture {};

// Test: weld build fails without config or inputs
TEST_F(ConfigTest, BuildFailsWithoutConfigOrInputs) {
  auto result = Run({"build"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("no input files"), std::string::npos);
}

// Test: weld check fails without config or inputs
TEST_F(ConfigTest, CheckFailsWithoutConfigOrInputs) {
  auto result = Run({"check"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("no input files"), std::string::npos);
}

// Test: positional inputs work without weld.toml
TEST_F(ConfigTest, BuildWorksWithPositionalInputs) {
  WriteFile("a.js", "console.log('a');\n");

  auto result = Run({"build", "a.js"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(ReadFile("dist/a.js"), "// a.js\nconsole.log('a');\n");
}

// Test: weld build reads entries and output settings from weld.toml
TEST_F(ConfigTest, BuildUsesWeldToml) {
  WriteFile("src/a.js", "import './shared.js';\nconsole.log('a');\n");
  WriteFile("src/b.js", "import './shared.js';\nconsole.log('b');\n");
  WriteFile("src/shared.js", "globalThis.ready = true;\n");
  WriteWeldToml(
      {"src/a.js", "src/b.js"},
      "[output]\ndir = \"out\"\nchunk_file_names = \"chunks/[name].js\"\n");

  auto result = Run({"build"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("out/a.js"));
  EXPECT_TRUE(FileExists("out/b.js"));
  EXPECT_TRUE(FileExists("out/chunks/shared.js"));
  EXPECT_EQ(
      ReadFile("out/a.js"),
      "import \"./chunks/shared.js\";\n// src/a.js\nconsole.log('a');\n");
}

// Test: named entries from [[project.entry]] name their chunks
TEST_F(ConfigTest, NamedEntryNamesItsChunk) {
  WriteFile("src/index.js", "console.log('main');\n");
  WriteFile(
      "weld.toml",
      "[project]\n\n[[project.entry]]\nname = \"main\"\n"
      "input = \"src/index.js\"\n");

  auto result = Run({"build"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("dist/main.js"));
}

// Test: banner and footer from weld.toml wrap every chunk
TEST_F(ConfigTest, BannerAndFooterFromConfig) {
  WriteFile("a.js", "console.log('a');\n");
  WriteWeldToml(
      {"a.js"}, "[output]\nbanner = \"/* top */\"\nfooter = \"/* end */\"\n");

  auto result = Run({"build"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(
      ReadFile("dist/a.js"),
      "/* top */\n// a.js\nconsole.log('a');\n/* end */\n");
}

// Test: the command line format overrides weld.toml
TEST_F(ConfigTest, FormatFlagOverridesConfig) {
  WriteFile("a.js", "export const answer = 42;\n");
  WriteWeldToml({"a.js"}, "[output]\nformat = \"esm\"\n");

  auto result = Run({"build", "--format", "cjs"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      ReadFile("dist/a.js").find("Object.defineProperty(exports, \"answer\""),
      std::string::npos);
}

// Test: an unknown format in weld.toml is reported
TEST_F(ConfigTest, UnknownFormatInConfigFails) {
  WriteFile("a.js", "console.log('a');\n");
  WriteWeldToml({"a.js"}, "[output]\nformat = \"umd\"\n");

  auto result = Run({"build"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.combined_output.find("unknown output format 'umd'"),
      std::string::npos);
}

// Test: an unknown --format is reported
TEST_F(ConfigTest, UnknownFormatFlagFails) {
  WriteFile("a.js", "console.log('a');\n");

  auto result = Run({"build", "--format", "umd", "a.js"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.combined_output.find("unknown format 'umd'"), std::string::npos);
}

// Test: malformed weld.toml is reported
TEST_F(ConfigTest, MalformedConfigFails) {
  WriteFile("weld.toml", "[project\n");

  auto result = Run({"build"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(result.combined_output.find("failed to parse"), std::string::npos);
}

// Test: weld.toml is found from a subdirectory
TEST_F(ConfigTest, ConfigFoundFromSubdirectory) {
  WriteFile("a.js", "console.log('a');\n");
  WriteWeldToml({"a.js"});
  WriteFile("nested/deeper/.keep", "");

  auto result = RunIn(TestDir() / "nested" / "deeper", {"build"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("dist/a.js"));
}

// Test: -C runs as if started in another directory
TEST_F(ConfigTest, ChangeDirectoryFlag) {
  WriteFile("app/a.js", "console.log('a');\n");

  auto result = Run({"-C", "app", "build", "a.js"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("app/dist/a.js"));
}

// Test: -C with a missing directory fails
TEST_F(ConfigTest, ChangeDirectoryToMissingDirFails) {
  auto result = Run({"-C", "nowhere", "build"});

  EXPECT_FALSE(result.Success());
  EXPECT_NE(
      result.combined_output.find("cannot change to 'nowhere'"),
      std::string::npos);
}

// Test: --sourcemap writes maps next to the chunks
TEST_F(ConfigTest, SourcemapFlagWritesMaps) {
  WriteFile("a.js", "console.log('a');\n");

  auto result = Run({"build", "--sourcemap", "a.js"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(FileExists("dist/a.js.map"));
  EXPECT_NE(
      ReadFile("dist/a.js").find("//# sourceMappingURL=a.js.map"),
      std::string::npos);
}

// Test: check links without writing anything
TEST_F(ConfigTest, CheckWritesNothing) {
  WriteFile("a.js", "console.log('a');\n");

  auto result = Run({"check", "a.js"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_FALSE(FileExists("dist"));
}

// Test: link errors fail the build with every diagnostic
TEST_F(ConfigTest, LinkErrorsFailBuild) {
  WriteFile(
      "a.js", "import { y } from './b.js';\nimport { z } from './b.js';\n");
  WriteFile("b.js", "export const x = 1;\n");

  auto result = Run({"build", "a.js"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(
      result.combined_output.find("\"y\" is not exported by \"b.js\""),
      std::string::npos);
  EXPECT_NE(
      result.combined_output.find("\"z\" is not exported by \"b.js\""),
      std::string::npos);
  EXPECT_NE(result.combined_output.find("2 errors"), std::string::npos);
  EXPECT_FALSE(FileExists("dist/a.js"));
}

// Test: warnings are printed and the build still succeeds
TEST_F(ConfigTest, WarningsDoNotFailBuild) {
  WriteFile("a.js", "export * from './lib.js';\n");
  WriteFile("lib.js", "exports.x = 1;\n");

  auto result = Run({"build", "a.js"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_NE(
      result.combined_output.find("re-exports nothing"), std::string::npos);
  EXPECT_NE(result.combined_output.find("1 warning"), std::string::npos);
}

}  // namespace
}  // namespace weld::test
