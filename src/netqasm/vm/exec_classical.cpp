#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <utility>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "netqasm/vm/executor.hpp"

namespace netqasm::vm {

using lang::Opcode;

namespace {

auto FitsInt32(int64_t value) -> bool {
  return value >= std::numeric_limits<int32_t>::min() &&
         value <= std::numeric_limits<int32_t>::max();
}

auto Overflow(Opcode opcode, int32_t a, int32_t b) -> Diagnostic {
  return Diagnostic::Execution(
      UnknownSpan{},
      fmt::format(
          "integer overflow in '{}' with operands {} and {}",
          lang::ToString(opcode), a, b));
}

}  // namespace

auto Executor::ExecSet(const lang::Instruction& instr) -> Result<void> {
  memory_->SetRegister(instr.Reg(0), instr.Imm(1));
  return {};
}

auto Executor::ExecArithmetic(const lang::Instruction& instr) -> Result<void> {
  int32_t a = memory_->GetRegister(instr.Reg(1));
  int32_t b = memory_->GetRegister(instr.Reg(2));
  int64_t wide = 0;
  switch (instr.opcode) {
    case Opcode::kAdd:
      wide = int64_t{a} + b;
      break;
    case Opcode::kSub:
      wide = int64_t{a} - b;
      break;
    case Opcode::kMul:
      wide = int64_t{a} * b;
      break;
    case Opcode::kDiv:
    case Opcode::kRem:
      if (b == 0) {
        return std::unexpected(
            Diagnostic::Execution(
                UnknownSpan{},
                fmt::format(
                    "division by zero in '{}'", lang::ToString(instr.opcode))));
      }
      // Truncates toward zero.
      wide = instr.opcode == Opcode::kDiv ? int64_t{a} / b : int64_t{a} % b;
      break;
    default:
      common::ThrowInternalError(
          "Executor::ExecArithmetic", "not an arithmetic opcode");
  }
  if (!FitsInt32(wide)) {
    return std::unexpected(Overflow(instr.opcode, a, b));
  }
  memory_->SetRegister(instr.Reg(0), static_cast<int32_t>(wide));
  return {};
}

auto Executor::ExecModular(const lang::Instruction& instr) -> Result<void> {
  int32_t a = memory_->GetRegister(instr.Reg(1));
  int32_t b = memory_->GetRegister(instr.Reg(2));
  int32_t mod = memory_->GetRegister(instr.Reg(3));
  if (mod < 1) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format("modulus must be at least 1, got {}", mod)));
  }
  int64_t wide = instr.opcode == Opcode::kAddm ? int64_t{a} + b
                                               : int64_t{a} - b;
  int64_t r = wide % mod;
  if (r < 0) {
    r += mod;
  }
  memory_->SetRegister(instr.Reg(0), static_cast<int32_t>(r));
  return {};
}

auto Executor::ExecBranch(const ExecState& state, const lang::Instruction& instr)
    -> Result<Next> {
  auto target_slot = *lang::BranchTargetIndex(instr.opcode);
  auto target = static_cast<uint32_t>(instr.Imm(target_slot));
  bool taken = false;
  switch (instr.opcode) {
    case Opcode::kJmp:
      taken = true;
      break;
    case Opcode::kBez:
      taken = memory_->GetRegister(instr.Reg(0)) == 0;
      break;
    case Opcode::kBnz:
      taken = memory_->GetRegister(instr.Reg(0)) != 0;
      break;
    default: {
      int32_t a = memory_->GetRegister(instr.Reg(0));
      int32_t b = memory_->GetRegister(instr.Reg(1));
      switch (instr.opcode) {
        case Opcode::kBeq:
          taken = a == b;
          break;
        case Opcode::kBne:
          taken = a != b;
          break;
        case Opcode::kBlt:
          taken = a < b;
          break;
        case Opcode::kBge:
          taken = a >= b;
          break;
        default:
          common::ThrowInternalError(
              "Executor::ExecBranch", "not a branch opcode");
      }
    }
  }
  return Next{taken ? target : state.pc + 1};
}

auto Executor::ExecArray(const lang::Instruction& instr) -> Result<void> {
  int32_t length = memory_->GetRegister(instr.Reg(0));
  return memory_->InitArray(instr.Addr(1).value, length);
}

auto Executor::ExecLoadStore(const lang::Instruction& instr) -> Result<void> {
  const auto& reg = instr.Reg(0);
  const auto& entry = instr.Entry(1);
  int32_t index = memory_->GetRegister(entry.index);

  if (instr.opcode == Opcode::kStore) {
    return memory_->SetEntry(
        entry.address.value, index, memory_->GetRegister(reg));
  }

  auto value = memory_->GetEntry(entry.address.value, index);
  if (!value) {
    return std::unexpected(std::move(value).error());
  }
  if (!*value) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format(
                "load of undefined entry @{}[{}]", entry.address.value,
                index)));
  }
  memory_->SetRegister(reg, **value);
  return {};
}

auto Executor::ExecUndef(const lang::Instruction& instr) -> Result<void> {
  const auto& entry = instr.Entry(0);
  return memory_->SetEntry(
      entry.address.value, memory_->GetRegister(entry.index), std::nullopt);
}

auto Executor::ExecLea(const lang::Instruction& instr) -> Result<void> {
  memory_->SetRegister(instr.Reg(0), instr.Addr(1).value);
  return {};
}

// Entanglement and messaging complete synchronously inside the processor
// calls, so a wait that is not already satisfied can never become satisfied.
auto Executor::ExecWait(const lang::Instruction& instr) -> Result<void> {
  if (instr.opcode == Opcode::kWaitSingle) {
    const auto& entry = instr.Entry(0);
    int32_t index = memory_->GetRegister(entry.index);
    auto value = memory_->GetEntry(entry.address.value, index);
    if (!value) {
      return std::unexpected(std::move(value).error());
    }
    if (!*value) {
      return std::unexpected(
          Diagnostic::Execution(
              UnknownSpan{},
              fmt::format(
                  "wait_single on entry @{}[{}] that will never be defined",
                  entry.address.value, index)));
    }
    return {};
  }

  const auto& slice = instr.Slice(0);
  int32_t start = memory_->GetRegister(slice.start);
  int32_t stop = memory_->GetRegister(slice.stop);
  auto values = memory_->GetSlice(slice.address.value, start, stop);
  if (!values) {
    return std::unexpected(std::move(values).error());
  }

  bool any = false;
  bool all = true;
  for (const auto& v : *values) {
    any = any || v.has_value();
    all = all && v.has_value();
  }
  bool satisfied = instr.opcode == Opcode::kWaitAll ? all : any;
  if (!satisfied) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format(
                "'{}' on slice @{}[{}:{}] that will never be satisfied",
                lang::ToString(instr.opcode), slice.address.value, start,
                stop)));
  }
  return {};
}

auto Executor::ExecReturn(ExecState& state, const lang::Instruction& instr)
    -> Result<void> {
  if (instr.opcode == Opcode::kRetReg) {
    const auto& reg = instr.Reg(0);
    state.returned.registers[reg] = memory_->GetRegister(reg);
    return {};
  }

  int32_t address = instr.Addr(0).value;
  auto array = memory_->GetArray(address);
  if (!array) {
    return std::unexpected(std::move(array).error());
  }
  state.returned.arrays[address] = **array;
  return {};
}

}  // namespace netqasm::vm
