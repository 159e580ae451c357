#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "tests/framework/test_case.hpp"

namespace weld::test {

// Case files live under this directory of an in-memory file system; output
// goes to its "dist" subdirectory.
inline constexpr std::string_view kProjectRoot = "/project";

struct CaseResult {
  bool success = false;
  // Chunk file names in output order.
  std::vector<std::string> chunks;
  // Everything written under the output directory, by relative path.
  std::map<std::string, std::string> files;
  // One "location: message" line per diagnostic.
  std::string errors;
  std::string warnings;
};

// Bundles the case's files with its options and writes the chunks.
auto RunBundle(const TestCase& test_case) -> CaseResult;

// RunBundle(), then checks every expectation of the case.
void RunTestCase(const TestCase& test_case);

}  // namespace weld::test
