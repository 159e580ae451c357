#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "weld/common/ids.hpp"
#include "weld/graph/module.hpp"
#include "weld/graph/symbol_table.hpp"

namespace weld::graph {

struct EntryPoint {
  std::optional<std::string> name;
  ModuleId module;
};

// Output of the scan stage: every discovered module, indexed by ModuleId, and
// the symbol arena they share.
struct ModuleGraph {
  std::vector<Module> modules;
  SymbolTable symbols;
  // In the order the entries were given; entry i owns reachability bit i.
  std::vector<EntryPoint> entries;
  // The synthetic runtime-helper module. Always module 0.
  ModuleId runtime;

  [[nodiscard]] auto operator[](ModuleId id) const -> const Module& {
    return modules[id.value];
  }
  [[nodiscard]] auto operator[](ModuleId id) -> Module& {
    return modules[id.value];
  }

  [[nodiscard]] auto ModuleCount() const -> size_t {
    return modules.size();
  }
};

}  // namespace weld::graph
