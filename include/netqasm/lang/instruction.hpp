#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::lang {

// One command: an opcode and its operands in the order of the opcode's shape.
struct Instruction {
  Opcode opcode = Opcode::kRet;
  std::vector<Operand> operands;

  auto operator==(const Instruction&) const -> bool = default;

  static auto Make(Opcode opcode, std::vector<Operand> operands)
      -> Instruction {
    return Instruction{.opcode = opcode, .operands = std::move(operands)};
  }

  static auto Set(Register reg, int32_t value) -> Instruction {
    return Make(Opcode::kSet, {reg, Immediate{value}});
  }

  static auto Rotation(Opcode opcode, Register qubit, Angle angle)
      -> Instruction {
    return Make(
        opcode,
        {qubit, Immediate{angle.num}, Immediate{angle.denom_exp}});
  }

  static auto ControlledRotation(
      Opcode opcode, Register control, Register target, Angle angle)
      -> Instruction {
    return Make(
        opcode, {control, target, Immediate{angle.num},
                 Immediate{angle.denom_exp}});
  }

  static auto Jump(Opcode opcode, std::vector<Operand> operands, Operand target)
      -> Instruction {
    operands.push_back(std::move(target));
    return Make(opcode, std::move(operands));
  }

  [[nodiscard]] auto Reg(size_t index) const -> const Register&;
  [[nodiscard]] auto Imm(size_t index) const -> int32_t;
  [[nodiscard]] auto Addr(size_t index) const -> const Address&;
  [[nodiscard]] auto Entry(size_t index) const -> const ArrayEntry&;
  [[nodiscard]] auto Slice(size_t index) const -> const ArraySlice&;
};

// Checks operand count and kinds against the opcode shape. Label references
// are accepted in branch-target slots only when `allow_labels` is set.
// Mismatches, and rotation exponents above Angle::kMaxDenomExp, are encoding
// errors.
auto TypeCheck(const Instruction& instr, bool allow_labels) -> Result<void>;

// Registers read or written by the instruction, including index registers of
// array entries and slices.
auto CollectRegisters(const Instruction& instr) -> std::vector<Register>;

// Angle carried by rotation and controlled-rotation instructions.
auto GetAngle(const Instruction& instr) -> std::optional<Angle>;

// Text form: mnemonic followed by space separated operands.
auto ToString(const Instruction& instr) -> std::string;

}  // namespace netqasm::lang
