#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "netqasm/lang/opcode.hpp"

namespace netqasm::lang {

// Quantum gate tags shared by the compiler, flavours and the processor
// interface.
enum class Gate : uint8_t {
  kX,
  kY,
  kZ,
  kH,
  kS,
  kK,
  kT,
  kRotX,
  kRotY,
  kRotZ,
  kCnot,
  kCphase,
  kCrotX,
  kCrotY,
  kMov,
};

inline constexpr uint32_t kNumGates = static_cast<uint32_t>(Gate::kMov) + 1;

[[nodiscard]] auto GateOpcode(Gate gate) -> Opcode;
[[nodiscard]] auto OpcodeGate(Opcode opcode) -> std::optional<Gate>;

// Gates carrying an (n, d) angle: rotations and controlled rotations.
[[nodiscard]] auto IsParameterized(Gate gate) -> bool;
[[nodiscard]] auto IsTwoQubit(Gate gate) -> bool;

auto ToString(Gate gate) -> std::string_view;

}  // namespace netqasm::lang
