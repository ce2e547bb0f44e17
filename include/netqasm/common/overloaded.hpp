#pragma once

namespace netqasm {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const Register& r) { ... },
//       [](const Immediate& i) { ... },
//   }, operand);

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace netqasm
