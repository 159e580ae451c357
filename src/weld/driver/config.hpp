#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/output_format.hpp"

namespace weld::driver {

struct EntryConfig {
  std::optional<std::string> name;
  std::string input;
};

struct ProjectConfig {
  std::string name;
  // In entry order: `project.input` first, then `[[project.entry]]` tables.
  std::vector<EntryConfig> entries;
  std::string out_dir = "dist";
  OutputFormat format = OutputFormat::kEsm;
  std::string entry_file_names = "[name].js";
  std::string chunk_file_names = "[name].js";
  bool sourcemap = false;
  std::optional<std::string> banner;
  std::optional<std::string> footer;
  size_t threads = 0;

  // Directory where weld.toml was found
  std::filesystem::path root_dir;
};

// Search for weld.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse weld.toml file.
// Returns error Diagnostic on parse errors or malformed fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace weld::driver
