#pragma once

#include <string>

#include "input.hpp"
#include "weld/chunk/chunk_graph.hpp"
#include "weld/link/link_stage.hpp"

namespace weld::driver {

// Scan, link, render and write every chunk. Returns the exit code.
auto Build(const BuildInput& input) -> int;

// Scan and link only, reporting diagnostics.
auto Check(const BuildInput& input) -> int;

// Print the chunk assignment or the module table to stdout.
auto DumpChunks(const BuildInput& input) -> int;
auto DumpModules(const BuildInput& input) -> int;

auto FormatChunkDump(
    const chunk::ChunkGraph& chunk_graph, const link::LinkStageOutput& link)
    -> std::string;
auto FormatModuleDump(const link::LinkStageOutput& link) -> std::string;

}  // namespace weld::driver
