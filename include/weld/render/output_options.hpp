#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "weld/common/diagnostic/diagnostic.hpp"
#include "weld/common/output_format.hpp"
#include "weld/render/rendered_chunk.hpp"

namespace weld::render {

// Banner or footer callable. An empty or absent result adds nothing; an
// error fails the chunk.
using AddonHook = std::function<Result<std::optional<std::string>>(
    const RenderedChunk&)>;

struct OutputOptions {
  OutputFormat format = OutputFormat::kEsm;
  std::filesystem::path cwd;
  // Output directory, relative to cwd.
  std::string dir = "dist";
  std::string entry_file_names = "[name].js";
  std::string chunk_file_names = "[name].js";
  bool sourcemap = false;
  AddonHook banner;
  AddonHook footer;
};

// Hook that always returns `text`.
inline auto StaticAddon(std::string text) -> AddonHook {
  return [text = std::move(text)](const RenderedChunk&)
             -> Result<std::optional<std::string>> { return text; };
}

}  // namespace weld::render
