#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/lang/opcode.hpp"

namespace netqasm::flavour {

// Placement of a gate's qubits relative to the flavour's communication
// qubit (the electron on NV).
enum class Topology : uint8_t {
  kSingle,           // One-qubit gate
  kElectronCarbon,   // First operand is the electron
  kCarbonElectron,   // Second operand is the electron
  kCarbonCarbon,     // Neither operand is the electron
};

// Which qubit of the decomposed gate a step acts on.
enum class StepQubit : uint8_t {
  kFirst,
  kSecond,
  kElectron,
};

// One entry of a decomposition sequence, in application order. A step whose
// gate is not native is decomposed again for its own topology.
struct NativeStep {
  lang::Gate gate;
  StepQubit qubit = StepQubit::kFirst;
  StepQubit other = StepQubit::kSecond;  // Two-qubit steps only
  int32_t angle_num = 0;                 // Parameterized steps only

  auto operator==(const NativeStep&) const -> bool = default;
};

struct DecompositionKey {
  lang::Gate gate;
  Topology topology;

  auto operator==(const DecompositionKey&) const -> bool = default;
  auto operator<=>(const DecompositionKey&) const = default;
};

using DecompositionTable = std::map<DecompositionKey, std::vector<NativeStep>>;

// Immutable capability descriptor selected once per session.
struct Flavour {
  std::string name;

  // Wire id per opcode; nullopt marks an opcode the flavour rejects.
  std::array<std::optional<uint8_t>, lang::kNumOpcodes> wire_ids{};

  // Gates the flavour executes directly.
  std::vector<lang::Gate> native_gates;

  DecompositionTable decompositions;

  // Angle exponent every rotation is re-expressed at, when fixed.
  std::optional<uint8_t> fixed_denom_exp;

  // Denominator exponent used when decomposition steps carry angles.
  uint8_t step_denom_exp = 0;

  uint32_t register_count = 16;
  int32_t array_address_limit = 1024;

  // Virtual id of the communication qubit, when the topology matters.
  std::optional<int32_t> electron_virtual_id;

  [[nodiscard]] auto WireId(lang::Opcode opcode) const
      -> std::optional<uint8_t> {
    return wire_ids[static_cast<size_t>(opcode)];
  }

  [[nodiscard]] auto Supports(lang::Opcode opcode) const -> bool {
    return WireId(opcode).has_value();
  }

  [[nodiscard]] auto OpcodeFromWire(uint8_t wire_id) const
      -> std::optional<lang::Opcode>;

  [[nodiscard]] auto IsNative(lang::Gate gate) const -> bool;

  [[nodiscard]] auto FindDecomposition(lang::Gate gate, Topology topology) const
      -> const std::vector<NativeStep>*;

  // Canonical encoding of a rotation angle for this flavour.
  [[nodiscard]] auto CanonicalAngle(lang::Angle angle) const -> lang::Angle;
};

auto Vanilla() -> const Flavour&;
auto Nv() -> const Flavour&;

// Looks up a built-in flavour ("vanilla", "nv").
auto FlavourByName(std::string_view name) -> Result<const Flavour*>;

}  // namespace netqasm::flavour
