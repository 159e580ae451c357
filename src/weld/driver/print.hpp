#pragma once

#include <string>
#include <vector>

#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Every diagnostic with its notes, then an "N warnings and M errors
// generated." summary.
void PrintDiagnostics(const std::vector<Diagnostic>& diagnostics);
void PrintDiagnostics(const BatchedErrors& errors);

// Uncolored form of one diagnostic, one line per item.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

}  // namespace weld::driver
