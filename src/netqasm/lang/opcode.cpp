#include "netqasm/lang/opcode.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include "netqasm/common/internal_error.hpp"

namespace netqasm::lang {

namespace {

constexpr std::array<OpcodeInfo, kNumOpcodes> kOpcodeTable = {{
    {.mnemonic = "qalloc", .shape = OperandShape::kReg},
    {.mnemonic = "init", .shape = OperandShape::kReg},
    {.mnemonic = "array", .shape = OperandShape::kRegAddr},
    {.mnemonic = "set", .shape = OperandShape::kRegImm},
    {.mnemonic = "store", .shape = OperandShape::kRegEntry},
    {.mnemonic = "load", .shape = OperandShape::kRegEntry},
    {.mnemonic = "undef", .shape = OperandShape::kEntry},
    {.mnemonic = "lea", .shape = OperandShape::kRegAddr},
    {.mnemonic = "jmp", .shape = OperandShape::kImm},
    {.mnemonic = "bez", .shape = OperandShape::kRegImm},
    {.mnemonic = "bnz", .shape = OperandShape::kRegImm},
    {.mnemonic = "beq", .shape = OperandShape::kRegRegImm},
    {.mnemonic = "bne", .shape = OperandShape::kRegRegImm},
    {.mnemonic = "blt", .shape = OperandShape::kRegRegImm},
    {.mnemonic = "bge", .shape = OperandShape::kRegRegImm},
    {.mnemonic = "add", .shape = OperandShape::kRegRegReg},
    {.mnemonic = "sub", .shape = OperandShape::kRegRegReg},
    {.mnemonic = "addm", .shape = OperandShape::kRegRegRegReg},
    {.mnemonic = "subm", .shape = OperandShape::kRegRegRegReg},
    {.mnemonic = "mul", .shape = OperandShape::kRegRegReg},
    {.mnemonic = "div", .shape = OperandShape::kRegRegReg},
    {.mnemonic = "rem", .shape = OperandShape::kRegRegReg},
    {.mnemonic = "x", .shape = OperandShape::kReg},
    {.mnemonic = "y", .shape = OperandShape::kReg},
    {.mnemonic = "z", .shape = OperandShape::kReg},
    {.mnemonic = "h", .shape = OperandShape::kReg},
    {.mnemonic = "s", .shape = OperandShape::kReg},
    {.mnemonic = "k", .shape = OperandShape::kReg},
    {.mnemonic = "t", .shape = OperandShape::kReg},
    {.mnemonic = "rot_x", .shape = OperandShape::kRegImmImm},
    {.mnemonic = "rot_y", .shape = OperandShape::kRegImmImm},
    {.mnemonic = "rot_z", .shape = OperandShape::kRegImmImm},
    {.mnemonic = "cnot", .shape = OperandShape::kRegReg},
    {.mnemonic = "cphase", .shape = OperandShape::kRegReg},
    {.mnemonic = "crot_x", .shape = OperandShape::kRegRegImmImm},
    {.mnemonic = "crot_y", .shape = OperandShape::kRegRegImmImm},
    {.mnemonic = "mov", .shape = OperandShape::kRegReg},
    {.mnemonic = "meas", .shape = OperandShape::kRegReg},
    {.mnemonic = "create_epr", .shape = OperandShape::kReg5},
    {.mnemonic = "recv_epr", .shape = OperandShape::kRegRegRegReg},
    {.mnemonic = "wait_all", .shape = OperandShape::kSlice},
    {.mnemonic = "wait_any", .shape = OperandShape::kSlice},
    {.mnemonic = "wait_single", .shape = OperandShape::kEntry},
    {.mnemonic = "qfree", .shape = OperandShape::kReg},
    {.mnemonic = "send", .shape = OperandShape::kRegReg},
    {.mnemonic = "recv", .shape = OperandShape::kRegReg},
    {.mnemonic = "ret_reg", .shape = OperandShape::kReg},
    {.mnemonic = "ret_arr", .shape = OperandShape::kAddr},
    {.mnemonic = "ret", .shape = OperandShape::kNone},
    {.mnemonic = "breakpoint", .shape = OperandShape::kImmImm},
}};

using S = SlotKind;

constexpr std::array<SlotKind, 1> kReg = {S::kRegister};
constexpr std::array<SlotKind, 2> kRegReg = {S::kRegister, S::kRegister};
constexpr std::array<SlotKind, 3> kRegRegReg = {
    S::kRegister, S::kRegister, S::kRegister};
constexpr std::array<SlotKind, 4> kRegRegRegReg = {
    S::kRegister, S::kRegister, S::kRegister, S::kRegister};
constexpr std::array<SlotKind, 5> kReg5 = {
    S::kRegister, S::kRegister, S::kRegister, S::kRegister, S::kRegister};
constexpr std::array<SlotKind, 1> kImm = {S::kInt32};
constexpr std::array<SlotKind, 2> kRegImm = {S::kRegister, S::kInt32};
constexpr std::array<SlotKind, 3> kRegRegImm = {
    S::kRegister, S::kRegister, S::kInt32};
constexpr std::array<SlotKind, 3> kRegImmImm = {
    S::kRegister, S::kUint8, S::kUint8};
constexpr std::array<SlotKind, 4> kRegRegImmImm = {
    S::kRegister, S::kRegister, S::kUint8, S::kUint8};
constexpr std::array<SlotKind, 2> kImmImm = {S::kUint8, S::kUint8};
constexpr std::array<SlotKind, 2> kRegEntry = {S::kRegister, S::kEntry};
constexpr std::array<SlotKind, 2> kRegAddr = {S::kRegister, S::kAddress};
constexpr std::array<SlotKind, 1> kEntry = {S::kEntry};
constexpr std::array<SlotKind, 1> kSlice = {S::kSlice};
constexpr std::array<SlotKind, 1> kAddr = {S::kAddress};

}  // namespace

auto GetOpcodeInfo(Opcode opcode) -> const OpcodeInfo& {
  auto index = static_cast<size_t>(opcode);
  if (index >= kOpcodeTable.size()) {
    common::ThrowInternalError("GetOpcodeInfo", "opcode out of range");
  }
  return kOpcodeTable[index];
}

auto GetShapeSlots(OperandShape shape) -> std::span<const SlotKind> {
  switch (shape) {
    case OperandShape::kNone:
      return {};
    case OperandShape::kReg:
      return kReg;
    case OperandShape::kRegReg:
      return kRegReg;
    case OperandShape::kRegRegReg:
      return kRegRegReg;
    case OperandShape::kRegRegRegReg:
      return kRegRegRegReg;
    case OperandShape::kReg5:
      return kReg5;
    case OperandShape::kImm:
      return kImm;
    case OperandShape::kRegImm:
      return kRegImm;
    case OperandShape::kRegRegImm:
      return kRegRegImm;
    case OperandShape::kRegImmImm:
      return kRegImmImm;
    case OperandShape::kRegRegImmImm:
      return kRegRegImmImm;
    case OperandShape::kImmImm:
      return kImmImm;
    case OperandShape::kRegEntry:
      return kRegEntry;
    case OperandShape::kRegAddr:
      return kRegAddr;
    case OperandShape::kEntry:
      return kEntry;
    case OperandShape::kSlice:
      return kSlice;
    case OperandShape::kAddr:
      return kAddr;
  }
  common::ThrowInternalError("GetShapeSlots", "unknown operand shape");
}

auto OpcodeFromMnemonic(std::string_view mnemonic) -> std::optional<Opcode> {
  for (size_t i = 0; i < kOpcodeTable.size(); ++i) {
    if (kOpcodeTable[i].mnemonic == mnemonic) {
      return static_cast<Opcode>(i);
    }
  }
  return std::nullopt;
}

auto ToString(Opcode opcode) -> std::string_view {
  return GetOpcodeInfo(opcode).mnemonic;
}

auto BranchTargetIndex(Opcode opcode) -> std::optional<size_t> {
  switch (opcode) {
    case Opcode::kJmp:
      return 0;
    case Opcode::kBez:
    case Opcode::kBnz:
      return 1;
    case Opcode::kBeq:
    case Opcode::kBne:
    case Opcode::kBlt:
    case Opcode::kBge:
      return 2;
    default:
      return std::nullopt;
  }
}

}  // namespace netqasm::lang
