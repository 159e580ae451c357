#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace weld {

enum class OutputFormat : uint8_t {
  kEsm,  // ES modules: import/export glue
  kCjs,  // CommonJS: require/exports glue
  kApp,  // Self-executing application, no external export surface
};

[[nodiscard]] constexpr auto ToString(OutputFormat format) -> std::string_view {
  switch (format) {
    case OutputFormat::kEsm:
      return "esm";
    case OutputFormat::kCjs:
      return "cjs";
    case OutputFormat::kApp:
      return "app";
  }
  return "esm";
}

[[nodiscard]] constexpr auto ParseOutputFormat(std::string_view text)
    -> std::optional<OutputFormat> {
  if (text == "esm" || text == "es" || text == "module") {
    return OutputFormat::kEsm;
  }
  if (text == "cjs" || text == "commonjs") {
    return OutputFormat::kCjs;
  }
  if (text == "app") {
    return OutputFormat::kApp;
  }
  return std::nullopt;
}

}  // namespace weld
