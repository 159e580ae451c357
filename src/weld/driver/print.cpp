#include "print.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace weld::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kUnresolved:
      return "unresolved:";
    case DiagKind::kPluginError:
      return "plugin error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kUnresolved:
    case DiagKind::kPluginError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

auto LocationOf(const DiagItem& item) -> std::string {
  if (item.location && !item.location->empty()) {
    return *item.location;
  }
  return "weld";
}

void PrintDiagItem(const DiagItem& item, bool is_primary) {
  fmt::print(
      stderr, "{}: {} {}\n",
      fmt::styled(
          LocationOf(item),
          item.location ? fmt::text_style(fmt::emphasis::bold) : kToolStyle),
      fmt::styled(DiagKindToString(item.kind), DiagKindToStyle(item.kind)),
      fmt::styled(
          item.message, is_primary ? fmt::emphasis::bold : fmt::text_style{}));
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("weld", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("weld", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostics(const std::vector<Diagnostic>& diagnostics) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const auto& diag : diagnostics) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kUnresolved:
      case DiagKind::kPluginError:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }

    PrintDiagItem(diag.primary, true);
    for (const auto& note : diag.notes) {
      PrintDiagItem(note, false);
    }
  }

  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

void PrintDiagnostics(const BatchedErrors& errors) {
  PrintDiagnostics(errors.GetDiagnostics());
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = fmt::format(
      "{}: {} {}\n", LocationOf(diag.primary),
      DiagKindToString(diag.primary.kind), diag.primary.message);
  for (const auto& note : diag.notes) {
    out += fmt::format(
        "{}: {} {}\n", LocationOf(note), DiagKindToString(note.kind),
        note.message);
  }
  return out;
}

}  // namespace weld::driver
