#include "netqasm/lang/instruction.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::lang {

namespace {

template <typename T>
auto OperandAs(const Instruction& instr, size_t index, const char* what)
    -> const T& {
  if (index >= instr.operands.size()) {
    common::ThrowInternalError(
        "Instruction", fmt::format(
                           "{} operand {} missing on '{}'", what, index,
                           ToString(instr.opcode)));
  }
  const auto* value = std::get_if<T>(&instr.operands[index]);
  if (value == nullptr) {
    common::ThrowInternalError(
        "Instruction", fmt::format(
                           "operand {} of '{}' is not {}", index,
                           ToString(instr.opcode), what));
  }
  return *value;
}

auto SlotName(SlotKind kind) -> const char* {
  switch (kind) {
    case SlotKind::kRegister:
      return "register";
    case SlotKind::kInt32:
    case SlotKind::kUint8:
      return "immediate";
    case SlotKind::kAddress:
      return "array address";
    case SlotKind::kEntry:
      return "array entry";
    case SlotKind::kSlice:
      return "array slice";
  }
  return "operand";
}

auto SlotAccepts(
    SlotKind kind, const Operand& operand, bool label_allowed) -> bool {
  switch (kind) {
    case SlotKind::kRegister:
      return std::holds_alternative<Register>(operand);
    case SlotKind::kInt32:
      return std::holds_alternative<Immediate>(operand) ||
             (label_allowed && std::holds_alternative<LabelRef>(operand));
    case SlotKind::kUint8: {
      const auto* imm = std::get_if<Immediate>(&operand);
      return imm != nullptr && imm->value >= 0 && imm->value <= UINT8_MAX;
    }
    case SlotKind::kAddress:
      return std::holds_alternative<Address>(operand);
    case SlotKind::kEntry:
      return std::holds_alternative<ArrayEntry>(operand);
    case SlotKind::kSlice:
      return std::holds_alternative<ArraySlice>(operand);
  }
  return false;
}

}  // namespace

auto Instruction::Reg(size_t index) const -> const Register& {
  return OperandAs<Register>(*this, index, "register");
}

auto Instruction::Imm(size_t index) const -> int32_t {
  return OperandAs<Immediate>(*this, index, "immediate").value;
}

auto Instruction::Addr(size_t index) const -> const Address& {
  return OperandAs<Address>(*this, index, "address");
}

auto Instruction::Entry(size_t index) const -> const ArrayEntry& {
  return OperandAs<ArrayEntry>(*this, index, "array entry");
}

auto Instruction::Slice(size_t index) const -> const ArraySlice& {
  return OperandAs<ArraySlice>(*this, index, "array slice");
}

auto TypeCheck(const Instruction& instr, bool allow_labels) -> Result<void> {
  auto slots = GetShapeSlots(GetOpcodeInfo(instr.opcode).shape);
  if (instr.operands.size() != slots.size()) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{}, fmt::format(
                               "'{}' expects {} operands, got {}",
                               ToString(instr.opcode), slots.size(),
                               instr.operands.size())));
  }

  auto target = BranchTargetIndex(instr.opcode);
  for (size_t i = 0; i < slots.size(); ++i) {
    bool label_allowed = allow_labels && target && *target == i;
    if (!SlotAccepts(slots[i], instr.operands[i], label_allowed)) {
      return std::unexpected(
          Diagnostic::Encoding(
              UnknownSpan{},
              fmt::format(
                  "operand {} of '{}' must be {}, got '{}'", i,
                  ToString(instr.opcode),
                  slots[i] == SlotKind::kUint8 ? "an immediate in [0, 255]"
                                               : SlotName(slots[i]),
                  ToString(instr.operands[i]))));
    }
  }

  auto angle = GetAngle(instr);
  if (angle && angle->denom_exp > Angle::kMaxDenomExp) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{},
            fmt::format(
                "angle exponent {} of '{}' exceeds {}", angle->denom_exp,
                ToString(instr.opcode), Angle::kMaxDenomExp)));
  }
  return {};
}

auto CollectRegisters(const Instruction& instr) -> std::vector<Register> {
  std::vector<Register> regs;
  for (const auto& operand : instr.operands) {
    std::visit(
        Overloaded{
            [&](const Register& r) { regs.push_back(r); },
            [&](const ArrayEntry& e) { regs.push_back(e.index); },
            [&](const ArraySlice& s) {
              regs.push_back(s.start);
              regs.push_back(s.stop);
            },
            [](const auto&) {},
        },
        operand);
  }
  return regs;
}

auto GetAngle(const Instruction& instr) -> std::optional<Angle> {
  switch (instr.opcode) {
    case Opcode::kRotX:
    case Opcode::kRotY:
    case Opcode::kRotZ:
      return Angle{
          .num = instr.Imm(1), .denom_exp = static_cast<uint8_t>(instr.Imm(2))};
    case Opcode::kCrotX:
    case Opcode::kCrotY:
      return Angle{
          .num = instr.Imm(2), .denom_exp = static_cast<uint8_t>(instr.Imm(3))};
    default:
      return std::nullopt;
  }
}

auto ToString(const Instruction& instr) -> std::string {
  std::string out{ToString(instr.opcode)};
  for (const auto& operand : instr.operands) {
    out += ' ';
    out += ToString(operand);
  }
  return out;
}

}  // namespace netqasm::lang
