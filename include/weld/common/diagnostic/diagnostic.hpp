#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weld {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,        // Invalid module graph (missing export, bad syntax)
  kUnresolved,   // Static import/require that could not be resolved
  kPluginError,  // A plugin or output hook failed
  kHostError,    // I/O, malformed config
  kWarning,      // Non-fatal
  kNote,         // Auxiliary message
};

// Single diagnostic item (primary or note). `location` names the module the
// message is about, usually its pretty path; empty when there is none.
struct DiagItem {
  DiagKind kind;
  std::optional<std::string> location;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
  }

  static auto Error(std::string location, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .location = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: "module not found" for a static edge. `kind` is the import kind
  // as rendered in diagnostics ("import-statement", "require-call").
  static auto Unresolved(
      const std::string& importer, const std::string& specifier,
      std::string_view kind) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kUnresolved,
             .location = importer,
             .message = "Could not resolve \"" + specifier + "\" from \"" +
                        importer + "\" (" + std::string(kind) + ")"},
        .notes = {},
    };
  }

  static auto PluginError(
      std::string_view plugin, std::string_view hook, const std::string& msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kPluginError,
             .location = std::nullopt,
             .message = "[" + std::string(plugin) + "] " + std::string(hook) +
                        " hook failed: " + msg},
        .notes = {},
    };
  }

  // Factory: host error without module context
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = std::nullopt,
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto HostError(std::string location, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .location = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  static auto Warning(std::string location, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .location = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .location = std::nullopt,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace weld
