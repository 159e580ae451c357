#include "weld/render/js_syntax.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace weld::render {

namespace {

auto IsIdentifierStart(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
         c == '$';
}

}  // namespace

auto IsIdentifierName(std::string_view text) -> bool {
  if (text.empty() || !IsIdentifierStart(text.front())) {
    return false;
  }
  for (char c : text.substr(1)) {
    if (!IsIdentifierStart(c) && !(c >= '0' && c <= '9')) {
      return false;
    }
  }
  return true;
}

// JSON string escaping is a subset of what JavaScript accepts.
auto QuoteString(std::string_view text) -> std::string {
  return nlohmann::json(std::string(text))
      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto PropertyKey(std::string_view name) -> std::string {
  return IsIdentifierName(name) ? std::string(name) : QuoteString(name);
}

auto PropertyAccess(std::string_view name) -> std::string {
  if (IsIdentifierName(name)) {
    return "." + std::string(name);
  }
  return "[" + QuoteString(name) + "]";
}

}  // namespace weld::render
