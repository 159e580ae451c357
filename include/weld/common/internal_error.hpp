#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace weld::common {

// Broken link invariant: a bug in weld or in an upstream stage, never a user
// error. Always fatal for the chunk being built.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "internal error in {}: {}\n"
                "This is a bug in weld. Please report it along with the "
                "input graph.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace weld::common
