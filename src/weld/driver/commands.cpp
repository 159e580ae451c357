#include "commands.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "print.hpp"
#include "verbose_logger.hpp"
#include "weld/bundler/bundler.hpp"
#include "weld/common/internal_error.hpp"
#include "weld/common/path_utils.hpp"
#include "weld/graph/module.hpp"
#include "weld/scan/file_system.hpp"

namespace weld::driver {

namespace {

struct LinkedProject {
  link::LinkStageOutput link;
  std::optional<chunk::ChunkGraph> chunk_graph;
};

// Runs scan and link, plus chunking when asked. Diagnostics are printed
// here; std::nullopt means the build failed.
auto LinkProject(bundler::Bundler& bundler, VerboseLogger& vlog, bool chunk)
    -> std::optional<LinkedProject> {
  std::optional<graph::ModuleGraph> module_graph;
  {
    PhaseTimer timer(vlog, "scan");
    auto scanned = bundler.Scan();
    if (!scanned) {
      PrintDiagnostics(scanned.error());
      return std::nullopt;
    }
    module_graph = std::move(*scanned);
  }
  vlog.Detail(fmt::format("{} modules", module_graph->ModuleCount()));

  std::optional<link::LinkStageOutput> link;
  {
    PhaseTimer timer(vlog, "link");
    auto linked = bundler.Link(std::move(*module_graph));
    if (!linked) {
      PrintDiagnostics(linked.error());
      return std::nullopt;
    }
    link = std::move(*linked);
  }

  LinkedProject project{.link = std::move(*link), .chunk_graph = std::nullopt};
  std::vector<Diagnostic> warnings = project.link.warnings;
  if (chunk) {
    PhaseTimer timer(vlog, "chunk");
    project.chunk_graph = bundler.GenerateChunks(project.link);
    vlog.Detail(fmt::format("{} chunks", project.chunk_graph->chunks.size()));
    warnings.insert(
        warnings.end(), project.chunk_graph->warnings.begin(),
        project.chunk_graph->warnings.end());
  }
  PrintDiagnostics(warnings);
  return project;
}

// An InternalError is a weld bug: print it and exit with status 2.
template <typename Fn>
auto Guarded(Fn&& fn) -> int {
  try {
    return fn();
  } catch (const common::InternalError& e) {
    PrintError(e.what());
    return 2;
  }
}

}  // namespace

auto Build(const BuildInput& input) -> int {
  return Guarded([&] {
    VerboseLogger vlog(input.verbose);
    scan::OsFileSystem fs;
    bundler::Bundler bundler(input.options, fs);

    auto project = LinkProject(bundler, vlog, true);
    if (!project) {
      return 1;
    }

    std::optional<std::vector<bundler::OutputChunk>> chunks;
    {
      PhaseTimer timer(vlog, "render");
      auto rendered = bundler.Render(*project->chunk_graph, project->link);
      if (!rendered) {
        PrintDiagnostics(rendered.error());
        return 1;
      }
      chunks = std::move(*rendered);
    }

    {
      PhaseTimer timer(vlog, "write");
      auto written = bundler.WriteChunks(*chunks);
      if (!written) {
        PrintDiagnostics(written.error());
        return 1;
      }
    }
    for (const auto& chunk : *chunks) {
      vlog.Detail(
          fmt::format(
              "wrote {} ({} bytes)", chunk.file_name, chunk.code.size()));
    }

    if (input.stats) {
      vlog.PrintPhaseSummary();
    }
    return 0;
  });
}

auto Check(const BuildInput& input) -> int {
  return Guarded([&] {
    VerboseLogger vlog(input.verbose);
    scan::OsFileSystem fs;
    bundler::Bundler bundler(input.options, fs);
    if (!LinkProject(bundler, vlog, false)) {
      return 1;
    }
    if (input.stats) {
      vlog.PrintPhaseSummary();
    }
    return 0;
  });
}

auto DumpChunks(const BuildInput& input) -> int {
  return Guarded([&] {
    VerboseLogger vlog(input.verbose);
    scan::OsFileSystem fs;
    bundler::Bundler bundler(input.options, fs);
    auto project = LinkProject(bundler, vlog, true);
    if (!project) {
      return 1;
    }
    fmt::print("{}", FormatChunkDump(*project->chunk_graph, project->link));
    return 0;
  });
}

auto DumpModules(const BuildInput& input) -> int {
  return Guarded([&] {
    VerboseLogger vlog(input.verbose);
    scan::OsFileSystem fs;
    bundler::Bundler bundler(input.options, fs);
    auto project = LinkProject(bundler, vlog, false);
    if (!project) {
      return 1;
    }
    fmt::print("{}", FormatModuleDump(project->link));
    return 0;
  });
}

auto FormatChunkDump(
    const chunk::ChunkGraph& chunk_graph, const link::LinkStageOutput& link)
    -> std::string {
  std::string out;
  for (size_t i = 0; i < chunk_graph.chunks.size(); ++i) {
    const auto& chunk = chunk_graph.chunks[i];
    out += fmt::format(
        "chunk {} {} {}{}\n", i,
        chunk.preliminary_filename.value_or("<unnamed>"),
        chunk.IsEntry() ? "entry" : "common",
        chunk.name ? fmt::format(" ({})", *chunk.name) : "");
    for (ModuleId id : chunk.modules) {
      out += fmt::format("  {}\n", link.graph[id].pretty_path);
    }
    for (const auto& imports : chunk.imports_from_other_chunks) {
      out += fmt::format("  imports chunk {}:", imports.chunk.value);
      for (const auto& item : imports.items) {
        out += fmt::format(" {}", item.export_alias.value_or("?"));
      }
      out += "\n";
    }
    if (!chunk.exports.empty()) {
      out += "  exports:";
      for (const auto& item : chunk.exports) {
        out += fmt::format(" {}", item.alias);
      }
      out += "\n";
    }
  }
  return out;
}

auto FormatModuleDump(const link::LinkStageOutput& link) -> std::string {
  std::string out;
  for (ModuleId id : link.sorted_modules) {
    const graph::Module& module = link.graph[id];
    const auto& meta = link.Meta(id);
    out += fmt::format(
        "#{} {} exports={} wrap={} order={}\n", id.value, module.pretty_path,
        graph::ToString(module.exports_kind), link::ToString(meta.wrap_kind),
        meta.exec_order);
  }
  return out;
}

}  // namespace weld::driver
