#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace netqasm::lang {

// Every instruction variant known to any flavour. The wire id of an opcode is
// flavour-specific (see flavour::Flavour::WireId).
enum class Opcode : uint8_t {
  // Allocation and initialization
  kQAlloc,
  kInit,
  kArray,
  kSet,
  // Memory
  kStore,
  kLoad,
  kUndef,
  kLea,
  // Classical logic
  kJmp,
  kBez,
  kBnz,
  kBeq,
  kBne,
  kBlt,
  kBge,
  // Classical operations
  kAdd,
  kSub,
  kAddm,
  kSubm,
  kMul,
  kDiv,
  kRem,
  // Single-qubit gates
  kX,
  kY,
  kZ,
  kH,
  kS,
  kK,
  kT,
  // Single-qubit rotations
  kRotX,
  kRotY,
  kRotZ,
  // Two-qubit gates
  kCnot,
  kCphase,
  kCrotX,
  kCrotY,
  kMov,
  // Measurement
  kMeas,
  // Entanglement generation
  kCreateEpr,
  kRecvEpr,
  // Waiting
  kWaitAll,
  kWaitAny,
  kWaitSingle,
  // Deallocation
  kQFree,
  // Classical messaging
  kSend,
  kRecv,
  // Return
  kRetReg,
  kRetArr,
  kRet,
  // Debugging
  kBreakpoint,
};

inline constexpr uint32_t kNumOpcodes =
    static_cast<uint32_t>(Opcode::kBreakpoint) + 1;

// Fixed operand layout of an opcode.
enum class OperandShape : uint8_t {
  kNone,
  kReg,
  kRegReg,
  kRegRegReg,
  kRegRegRegReg,
  kReg5,
  kImm,           // int32 (jump target)
  kRegImm,        // register, int32
  kRegRegImm,     // register, register, int32
  kRegImmImm,     // register, uint8, uint8 (rotation angle)
  kRegRegImmImm,  // register, register, uint8, uint8
  kImmImm,        // uint8, uint8
  kRegEntry,
  kRegAddr,
  kEntry,
  kSlice,
  kAddr,
};

// Kind of a single operand slot within a shape.
enum class SlotKind : uint8_t {
  kRegister,
  kInt32,
  kUint8,
  kAddress,
  kEntry,
  kSlice,
};

struct OpcodeInfo {
  std::string_view mnemonic;
  OperandShape shape;
};

[[nodiscard]] auto GetOpcodeInfo(Opcode opcode) -> const OpcodeInfo&;

[[nodiscard]] auto GetShapeSlots(OperandShape shape)
    -> std::span<const SlotKind>;

[[nodiscard]] auto OpcodeFromMnemonic(std::string_view mnemonic)
    -> std::optional<Opcode>;

auto ToString(Opcode opcode) -> std::string_view;

// Operand index holding the branch target, if the opcode branches.
[[nodiscard]] auto BranchTargetIndex(Opcode opcode) -> std::optional<size_t>;

[[nodiscard]] inline auto IsBranch(Opcode opcode) -> bool {
  return BranchTargetIndex(opcode).has_value();
}

}  // namespace netqasm::lang
