#pragma once

#include <cstddef>
#include <expected>
#include <utility>
#include <vector>

#include "weld/common/diagnostic/diagnostic.hpp"

namespace weld {

// Every user-facing failure of one stage. Stages keep going after the first
// failure so a single build attempt reports as much as possible.
class BatchedErrors {
 public:
  BatchedErrors() = default;
  explicit BatchedErrors(Diagnostic diag) {
    diagnostics_.push_back(std::move(diag));
  }

  void Push(Diagnostic diag) {
    diagnostics_.push_back(std::move(diag));
  }

  void Merge(BatchedErrors other) {
    for (auto& diag : other.diagnostics_) {
      diagnostics_.push_back(std::move(diag));
    }
  }

  [[nodiscard]] auto IsEmpty() const -> bool {
    return diagnostics_.empty();
  }
  [[nodiscard]] auto Size() const -> size_t {
    return diagnostics_.size();
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  [[nodiscard]] auto begin() const {
    return diagnostics_.begin();
  }
  [[nodiscard]] auto end() const {
    return diagnostics_.end();
  }

 private:
  std::vector<Diagnostic> diagnostics_;
};

template <typename T>
using BatchResult = std::expected<T, BatchedErrors>;

}  // namespace weld
