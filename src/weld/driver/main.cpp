#include <argparse/argparse.hpp>
#include <cstddef>
#include <exception>
#include <expected>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "commands.hpp"
#include "config.hpp"
#include "input.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddBuildFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--format").help("Output format: esm, cjs or app");
  cmd.add_argument("--dir").help("Output directory");
  cmd.add_argument("--sourcemap")
      .default_value(false)
      .implicit_value(true)
      .help("Emit .map files");
  cmd.add_argument("-j", "--threads")
      .scan<'u', size_t>()
      .help("Worker threads (0 = hardware concurrency)");
  cmd.add_argument("inputs").remaining().help(
      "Entry modules (uses weld.toml if not specified)");
}

auto LoadOptionalConfig()
    -> weld::Result<std::optional<weld::driver::ProjectConfig>> {
  auto config_path = weld::driver::FindConfig();
  if (!config_path) {
    return std::nullopt;
  }
  auto config = weld::driver::LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::move(*config);
}

auto MakeInput(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& cmd)
    -> std::optional<weld::driver::BuildInput> {
  auto config = LoadOptionalConfig();
  if (!config) {
    weld::driver::PrintDiagnostics(std::vector{config.error()});
    return std::nullopt;
  }

  weld::driver::CliOverrides cli;
  if (auto inputs = cmd.present<std::vector<std::string>>("inputs")) {
    cli.inputs = *inputs;
  }
  if (cmd.is_used("--format")) {
    cli.format = cmd.get<std::string>("--format");
  }
  if (cmd.is_used("--dir")) {
    cli.dir = cmd.get<std::string>("--dir");
  }
  if (cmd.is_used("--sourcemap")) {
    cli.sourcemap = cmd.get<bool>("--sourcemap");
  }
  if (auto threads = cmd.present<size_t>("--threads")) {
    cli.threads = *threads;
  }

  auto input =
      weld::driver::MakeBuildInput(*config, cli, fs::current_path());
  if (!input) {
    weld::driver::PrintDiagnostics(std::vector{input.error()});
    return std::nullopt;
  }
  input->verbose = program.get<bool>("-v") ? 1 : 0;
  input->stats = program.get<bool>("--stats");
  return std::move(*input);
}

auto DumpCommand(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& cmd) -> int {
  auto what = cmd.get<std::string>("what");
  if (what != "chunks" && what != "modules") {
    weld::driver::PrintError(
        "unknown dump '" + what + "', use 'chunks' or 'modules'");
    return 1;
  }
  auto input = MakeInput(program, cmd);
  if (!input) {
    return 1;
  }
  if (what == "chunks") {
    return weld::driver::DumpChunks(*input);
  }
  return weld::driver::DumpModules(*input);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("weld", "0.1.0");
  program.add_description("JavaScript module bundler");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log pipeline phases to stderr");
  program.add_argument("--stats")
      .default_value(false)
      .implicit_value(true)
      .help("Print phase durations");

  // Subcommand: build
  argparse::ArgumentParser build_cmd("build");
  build_cmd.add_description("Bundle entry modules into output chunks");
  AddBuildFlags(build_cmd);

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Scan and link without writing output");
  AddBuildFlags(check_cmd);

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print chunk assignment or the module table");
  dump_cmd.add_argument("what").help("What to dump: chunks or modules");
  AddBuildFlags(dump_cmd);

  program.add_subparser(build_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    weld::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      weld::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  if (program.is_subcommand_used("build")) {
    auto input = MakeInput(program, build_cmd);
    return input ? weld::driver::Build(*input) : 1;
  }

  if (program.is_subcommand_used("check")) {
    auto input = MakeInput(program, check_cmd);
    return input ? weld::driver::Check(*input) : 1;
  }

  if (program.is_subcommand_used("dump")) {
    return DumpCommand(program, dump_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
