#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace weld::test {

struct SourceFile {
  std::string name;
  std::string content;
};

struct ExpectedOutput {
  std::optional<std::string> exact;
  std::vector<std::string> contains;
  std::vector<std::string> not_contains;

  [[nodiscard]] auto IsExact() const -> bool {
    return exact.has_value();
  }
};

struct EntrySpec {
  std::optional<std::string> name;
  std::string input;
};

// Output options a case may set; anything absent keeps the bundler default.
struct CaseOutput {
  std::string format = "esm";
  std::optional<std::string> entry_file_names;
  std::optional<std::string> chunk_file_names;
  std::optional<std::string> banner;
  std::optional<std::string> footer;
  bool sourcemap = false;
};

struct TestCase {
  std::string name;
  std::string feature;
  std::string source_yaml;  // Path to YAML file for error reporting
  std::vector<SourceFile> files;
  std::vector<EntrySpec> entries;
  CaseOutput output;
  size_t threads = 2;

  // Chunk file names in output order.
  std::optional<std::vector<std::string>> expected_chunks;
  // Keyed by chunk file name; ".map" names check the source map JSON.
  std::map<std::string, ExpectedOutput> expected_files;
  // Set when the build must fail; matched against all error messages.
  std::optional<ExpectedOutput> expected_error;
  std::optional<ExpectedOutput> expected_warnings;

  [[nodiscard]] auto ExpectsFailure() const -> bool {
    return expected_error.has_value();
  }
};

// GTest printer for readable test names
inline void PrintTo(const TestCase& test_case, std::ostream* os) {
  *os << test_case.feature << "/" << test_case.name;
}

}  // namespace weld::test
