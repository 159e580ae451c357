#pragma once

#include <string>
#include <string_view>

namespace weld::render {

// ASCII identifier names only; anything else gets quoted.
[[nodiscard]] auto IsIdentifierName(std::string_view text) -> bool;

// Double-quoted JavaScript string literal.
[[nodiscard]] auto QuoteString(std::string_view text) -> std::string;

// `name` usable as an object literal key or an export alias.
[[nodiscard]] auto PropertyKey(std::string_view name) -> std::string;

// `.name`, or `["name"]` when it is not an identifier.
[[nodiscard]] auto PropertyAccess(std::string_view name) -> std::string;

}  // namespace weld::render
