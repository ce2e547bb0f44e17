#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "netqasm/common/host_line.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::compiler {

// Virtual register. Ids are unique across banks within one program.
struct VReg {
  lang::RegisterBank bank = lang::RegisterBank::kR;
  uint32_t id = 0;

  auto operator==(const VReg&) const -> bool = default;
  auto operator<=>(const VReg&) const = default;

  template <typename H>
  friend auto AbslHashValue(H h, const VReg& reg) -> H {
    return H::combine(std::move(h), reg.bank, reg.id);
  }
};

struct VEntry {
  lang::Address address;
  VReg index;
};

struct VSlice {
  lang::Address address;
  VReg start;
  VReg stop;
};

using VOperand = std::variant<
    VReg, lang::Immediate, lang::Address, VEntry, VSlice, lang::LabelRef>;

struct VInstr {
  lang::Opcode opcode = lang::Opcode::kRet;
  std::vector<VOperand> operands;
  std::optional<HostLine> host_line;
};

// Label placed before the instruction at `index` (== size for the end).
struct VLabel {
  std::string name;
  uint32_t index = 0;
};

// Inclusive instruction range of a loop: from the header branch to the
// back jump.
struct LoopRegion {
  uint32_t begin = 0;
  uint32_t end = 0;
};

// Linear output of lowering, before register allocation.
struct VProgram {
  std::vector<VInstr> instrs;
  std::vector<VLabel> labels;
  std::vector<LoopRegion> loops;
  uint32_t num_vregs = 0;
};

// Virtual registers read or written by an instruction, in operand order.
auto CollectVRegs(const VInstr& instr) -> std::vector<VReg>;

auto ToString(const VInstr& instr) -> std::string;

}  // namespace netqasm::compiler
