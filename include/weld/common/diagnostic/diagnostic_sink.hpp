#pragma once

#include <string>
#include <utility>
#include <vector>

#include "weld/common/diagnostic/batched_errors.hpp"
#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld {

// Collects diagnostics during linking. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.IsError()) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(std::string location, std::string msg) {
    Report(Diagnostic::Error(std::move(location), std::move(msg)));
  }

  void Warning(std::string location, std::string msg) {
    Report(Diagnostic::Warning(std::move(location), std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  // Everything reported so far, warnings included, as one batch.
  [[nodiscard]] auto TakeBatch() -> BatchedErrors {
    BatchedErrors batch;
    for (auto& diag : diagnostics_) {
      batch.Push(std::move(diag));
    }
    diagnostics_.clear();
    has_errors_ = false;
    return batch;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace weld
