#pragma once

#include <compare>
#include <cstdint>
#include <utility>

namespace weld {

// Index of a module in the module table. Assigned in discovery order.
struct ModuleId {
  uint32_t value = UINT32_MAX;

  static constexpr auto Invalid() -> ModuleId {
    return {UINT32_MAX};
  }
  [[nodiscard]] auto IsValid() const -> bool {
    return value != UINT32_MAX;
  }

  auto operator==(const ModuleId&) const -> bool = default;
  auto operator<=>(const ModuleId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, ModuleId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

struct ChunkId {
  uint32_t value = UINT32_MAX;

  [[nodiscard]] auto IsValid() const -> bool {
    return value != UINT32_MAX;
  }

  auto operator==(const ChunkId&) const -> bool = default;
  auto operator<=>(const ChunkId&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, ChunkId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// Index into a module's import record list.
struct ImportRecordId {
  uint32_t value = 0;

  auto operator==(const ImportRecordId&) const -> bool = default;
};

// One declared binding, unique across the whole graph: the owning module plus
// the binding's index in that module's symbol list.
struct SymbolRef {
  ModuleId owner;
  uint32_t symbol = 0;

  auto operator==(const SymbolRef&) const -> bool = default;
  auto operator<=>(const SymbolRef&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, const SymbolRef& ref) -> H {
    return H::combine(std::move(h), ref.owner.value, ref.symbol);
  }
};

}  // namespace weld
