#pragma once

#include <cstdint>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/virtual_program.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::compiler {

// Inclusive range of instruction indices over which a virtual register must
// keep its value.
struct LiveInterval {
  VReg reg;
  uint32_t start = 0;
  uint32_t end = 0;

  auto operator==(const LiveInterval&) const -> bool = default;

  [[nodiscard]] auto Overlaps(const LiveInterval& other) const -> bool {
    return start <= other.end && other.start <= end;
  }
};

using RegisterAssignment = absl::flat_hash_map<VReg, lang::Register>;

// Computes live intervals and widens them over the loops they cross or
// carry a value around. Sorted by start, then by register id.
auto ComputeLiveIntervals(const VProgram& program) -> std::vector<LiveInterval>;

// Linear scan over `intervals`, handing out the lowest free index per bank.
// Fails with a layout error when a bank runs out of its `register_count`
// registers.
auto AllocateRegisters(
    const std::vector<LiveInterval>& intervals, uint32_t register_count)
    -> Result<RegisterAssignment>;

// Confirms that no two overlapping intervals share a physical register.
auto VerifyAssignment(
    const std::vector<LiveInterval>& intervals,
    const RegisterAssignment& assignment) -> Result<void>;

}  // namespace netqasm::compiler
