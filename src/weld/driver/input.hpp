#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "weld/bundler/bundler.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld::driver {

// Flags given on the command line; each one present overrides weld.toml.
struct CliOverrides {
  std::vector<std::string> inputs;
  std::optional<std::string> format;
  std::optional<std::string> dir;
  std::optional<bool> sourcemap;
  std::optional<size_t> threads;
};

struct BuildInput {
  bundler::BundlerOptions options;
  int verbose = 0;
  bool stats = false;
};

// Bundler options from the project config (if any) and the command line.
// Without a config the project root is `cwd`; positional inputs are taken
// relative to `cwd` either way.
auto MakeBuildInput(
    const std::optional<ProjectConfig>& config, const CliOverrides& cli,
    const std::filesystem::path& cwd) -> Result<BuildInput>;

}  // namespace weld::driver
