#include "config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld::driver {

namespace fs = std::filesystem;

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "weld.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [project] section
  auto project = tbl["project"];
  if (!project) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing [project] section", config_path.string())));
  }
  if (auto name = project["name"].value<std::string>()) {
    config.name = *name;
  } else {
    config.name = config.root_dir.filename().string();
  }

  if (auto* input_arr = project["input"].as_array()) {
    for (const auto& elem : *input_arr) {
      auto str = elem.value<std::string>();
      if (!str) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'project.input' must be a list of strings",
                    config_path.string())));
      }
      config.entries.push_back(
          EntryConfig{.name = std::nullopt, .input = *str});
    }
  }

  // [[project.entry]] tables
  if (auto* entry_arr = project["entry"].as_array()) {
    for (const auto& elem : *entry_arr) {
      const auto* entry = elem.as_table();
      std::optional<std::string> input;
      if (entry != nullptr) {
        input = (*entry)["input"].value<std::string>();
      }
      if (!input) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: every [[project.entry]] needs an 'input'",
                    config_path.string())));
      }
      config.entries.push_back(
          EntryConfig{
              .name = (*entry)["name"].value<std::string>(), .input = *input});
    }
  }

  // [output] section (optional)
  if (auto output = tbl["output"]) {
    if (auto dir = output["dir"].value<std::string>()) {
      config.out_dir = *dir;
    }
    if (auto format = output["format"].value<std::string>()) {
      auto parsed = ParseOutputFormat(*format);
      if (!parsed) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: unknown output format '{}', use 'esm', 'cjs' or "
                    "'app'",
                    config_path.string(), *format)));
      }
      config.format = *parsed;
    }
    if (auto names = output["entry_file_names"].value<std::string>()) {
      config.entry_file_names = *names;
    }
    if (auto names = output["chunk_file_names"].value<std::string>()) {
      config.chunk_file_names = *names;
    }
    if (auto sourcemap = output["sourcemap"].value<bool>()) {
      config.sourcemap = *sourcemap;
    }
    config.banner = output["banner"].value<std::string>();
    config.footer = output["footer"].value<std::string>();
  }

  // [build] section (optional)
  if (auto build = tbl["build"]) {
    if (auto threads = build["threads"].value<int64_t>()) {
      if (*threads < 0) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'build.threads' must not be negative",
                    config_path.string())));
      }
      config.threads = static_cast<size_t>(*threads);
    }
  }

  return config;
}

}  // namespace weld::driver
