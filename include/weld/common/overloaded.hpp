#pragma once

namespace weld::common {

// Builds one visitor out of several lambdas for std::visit, so every piece
// kind of a statement is handled at the call site:
//
//   std::visit(Overloaded{
//       [](const TextPiece& t) { ... },
//       [](const SymbolPiece& s) { ... },
//   }, piece);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace weld::common
