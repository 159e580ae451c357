#include "input.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <fmt/core.h>

#include "weld/common/output_format.hpp"
#include "weld/render/output_options.hpp"

namespace weld::driver {

namespace fs = std::filesystem;

auto MakeBuildInput(
    const std::optional<ProjectConfig>& config, const CliOverrides& cli,
    const fs::path& cwd) -> Result<BuildInput> {
  BuildInput input;
  bundler::BundlerOptions& options = input.options;
  render::OutputOptions& output = options.output;
  output.cwd = config ? config->root_dir : cwd;

  if (config) {
    output.format = config->format;
    output.dir = config->out_dir;
    output.entry_file_names = config->entry_file_names;
    output.chunk_file_names = config->chunk_file_names;
    output.sourcemap = config->sourcemap;
    if (config->banner) {
      output.banner = render::StaticAddon(*config->banner);
    }
    if (config->footer) {
      output.footer = render::StaticAddon(*config->footer);
    }
    options.threads = config->threads;
  }

  // Inputs: the command line replaces the config entirely.
  if (!cli.inputs.empty()) {
    for (const auto& file : cli.inputs) {
      fs::path path = file;
      if (path.is_relative()) {
        path = cwd / path;
      }
      options.input.push_back(
          scan::InputItem{
              .name = std::nullopt,
              .import = path.lexically_normal().string()});
    }
  } else if (config) {
    for (const auto& entry : config->entries) {
      options.input.push_back(
          scan::InputItem{.name = entry.name, .import = entry.input});
    }
  }
  if (options.input.empty()) {
    return std::unexpected(Diagnostic::HostError("no input files"));
  }

  if (cli.format) {
    auto format = ParseOutputFormat(*cli.format);
    if (!format) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "unknown format '{}', use 'esm', 'cjs' or 'app'",
                  *cli.format)));
    }
    output.format = *format;
  }
  if (cli.dir) {
    output.dir = *cli.dir;
  }
  if (cli.sourcemap) {
    output.sourcemap = *cli.sourcemap;
  }
  if (cli.threads) {
    options.threads = *cli.threads;
  }
  return input;
}

}  // namespace weld::driver
