#pragma once

#include <array>
#include <string>
#include <string_view>

namespace weld::scan {

// Resource id of the runtime-helper module. The leading NUL keeps it apart
// from every file path.
inline auto RuntimeModuleId() -> const std::string& {
  static const std::string kId("\0weld:runtime", 13);
  return kId;
}

// Helpers the link stage may reference, in the order the runtime exports
// them.
inline constexpr std::array<std::string_view, 5> kRuntimeHelpers = {
    "__commonJS", "__esm", "__export", "__toESM", "__toCommonJS",
};

// JavaScript source of the runtime module, an ES module exporting
// kRuntimeHelpers.
auto RuntimeSource() -> std::string_view;

}  // namespace weld::scan
