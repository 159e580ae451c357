#include "tests/framework/runner.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "tests/framework/assertions.hpp"
#include "tests/framework/test_case.hpp"
#include "weld/bundler/bundler.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/output_format.hpp"
#include "weld/render/output_options.hpp"
#include "weld/scan/file_system.hpp"

namespace weld::test {
namespace {

namespace fs = std::filesystem;

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string line;
  if (diag.primary.location) {
    line += *diag.primary.location + ": ";
  }
  line += diag.primary.message;
  for (const auto& note : diag.notes) {
    line += "\n  note: " + note.message;
  }
  return line + "\n";
}

template <typename Diagnostics>
auto FormatAll(const Diagnostics& diagnostics) -> std::string {
  std::string out;
  for (const auto& diag : diagnostics) {
    out += FormatDiagnostic(diag);
  }
  return out;
}

auto MakeOptions(const TestCase& test_case) -> bundler::BundlerOptions {
  bundler::BundlerOptions options;
  for (const auto& entry : test_case.entries) {
    options.input.push_back(
        scan::InputItem{.name = entry.name, .import = entry.input});
  }
  options.threads = test_case.threads;

  render::OutputOptions& output = options.output;
  output.cwd = fs::path(kProjectRoot);
  auto format = ParseOutputFormat(test_case.output.format);
  EXPECT_TRUE(format.has_value())
      << "unknown format '" << test_case.output.format << "' in "
      << test_case.source_yaml;
  output.format = format.value_or(OutputFormat::kEsm);
  if (test_case.output.entry_file_names) {
    output.entry_file_names = *test_case.output.entry_file_names;
  }
  if (test_case.output.chunk_file_names) {
    output.chunk_file_names = *test_case.output.chunk_file_names;
  }
  if (test_case.output.banner) {
    output.banner = render::StaticAddon(*test_case.output.banner);
  }
  if (test_case.output.footer) {
    output.footer = render::StaticAddon(*test_case.output.footer);
  }
  output.sourcemap = test_case.output.sourcemap;
  return options;
}

}  // namespace

auto RunBundle(const TestCase& test_case) -> CaseResult {
  scan::MemoryFileSystem file_system;
  fs::path root(kProjectRoot);
  for (const auto& file : test_case.files) {
    file_system.AddFile(root / file.name, file.content);
  }

  bundler::Bundler bundler(MakeOptions(test_case), file_system);
  auto output = bundler.Write();

  CaseResult result;
  if (!output) {
    result.errors = FormatAll(output.error());
    return result;
  }
  result.success = true;
  result.warnings = FormatAll(output->warnings);
  for (const auto& chunk : output->chunks) {
    result.chunks.push_back(chunk.file_name);
  }

  // Read back what was written rather than the in-memory chunks, so the
  // written file names and .map files are checked too.
  std::string out_dir =
      (root / bundler.Options().output.dir).generic_string() + "/";
  for (const auto& [path, content] : file_system.Files()) {
    if (path.starts_with(out_dir)) {
      result.files.emplace(path.substr(out_dir.size()), content);
    }
  }
  return result;
}

void RunTestCase(const TestCase& test_case) {
  CaseResult result = RunBundle(test_case);

  if (test_case.ExpectsFailure()) {
    ASSERT_FALSE(result.success)
        << "expected the build to fail, chunks: " << result.chunks.size();
    AssertOutput(result.errors, *test_case.expected_error, "Errors");
    return;
  }
  ASSERT_TRUE(result.success) << result.errors;

  if (test_case.expected_chunks) {
    EXPECT_EQ(result.chunks, *test_case.expected_chunks);
  }
  AssertFiles(result.files, test_case.expected_files);
  if (test_case.expected_warnings) {
    AssertOutput(result.warnings, *test_case.expected_warnings, "Warnings");
  }
}

}  // namespace weld::test
