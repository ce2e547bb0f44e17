#include "netqasm/vm/executor.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::vm {

using lang::Opcode;

auto Executor::Run(ExecState& state) -> Result<ExecStatus> {
  if (state.subroutine == nullptr) {
    common::ThrowInternalError("Executor::Run", "no subroutine to run");
  }
  const auto& subroutine = *state.subroutine;

  while (state.status == ExecStatus::kRunning) {
    if (state.pc >= subroutine.Size()) {
      // Falling off the end is an implicit return.
      state.status = ExecStatus::kReturned;
      break;
    }

    const auto& instr = subroutine[state.pc];
    spdlog::debug("vm: {:>4}  {}", state.pc, lang::ToString(instr));

    auto next = ExecInstruction(state, instr);
    if (!next) {
      return std::unexpected(
          std::move(next).error().AtInstruction(subroutine.SpanOf(state.pc)));
    }
    ++state.steps;
    if (!*next) {
      state.status = ExecStatus::kReturned;
      break;
    }
    state.pc = **next;
  }
  return state.status;
}

auto Executor::Execute(const lang::Subroutine& subroutine)
    -> Result<ReturnedValues> {
  auto valid = lang::ValidateSubroutine(subroutine, *flavour_);
  if (!valid) {
    return std::unexpected(std::move(valid).error());
  }

  ExecState state{.subroutine = &subroutine};
  auto status = Run(state);
  if (!status) {
    return std::unexpected(std::move(status).error());
  }
  spdlog::debug(
      "vm: subroutine for app {} returned after {} steps", subroutine.AppId(),
      state.steps);
  return std::move(state.returned);
}

auto Executor::ExecInstruction(ExecState& state, const lang::Instruction& instr)
    -> Result<Next> {
  auto advance = [&](Result<void> r) -> Result<Next> {
    if (!r) {
      return std::unexpected(std::move(r).error());
    }
    return Next{state.pc + 1};
  };

  switch (instr.opcode) {
    case Opcode::kSet:
      return advance(ExecSet(instr));

    case Opcode::kAdd:
    case Opcode::kSub:
    case Opcode::kMul:
    case Opcode::kDiv:
    case Opcode::kRem:
      return advance(ExecArithmetic(instr));

    case Opcode::kAddm:
    case Opcode::kSubm:
      return advance(ExecModular(instr));

    case Opcode::kJmp:
    case Opcode::kBez:
    case Opcode::kBnz:
    case Opcode::kBeq:
    case Opcode::kBne:
    case Opcode::kBlt:
    case Opcode::kBge:
      return ExecBranch(state, instr);

    case Opcode::kArray:
      return advance(ExecArray(instr));
    case Opcode::kStore:
    case Opcode::kLoad:
      return advance(ExecLoadStore(instr));
    case Opcode::kUndef:
      return advance(ExecUndef(instr));
    case Opcode::kLea:
      return advance(ExecLea(instr));

    case Opcode::kQAlloc:
      return advance(ExecQAlloc(instr));
    case Opcode::kInit:
      return advance(ExecInit(instr));
    case Opcode::kQFree:
      return advance(ExecQFree(instr));

    case Opcode::kX:
    case Opcode::kY:
    case Opcode::kZ:
    case Opcode::kH:
    case Opcode::kS:
    case Opcode::kK:
    case Opcode::kT:
    case Opcode::kRotX:
    case Opcode::kRotY:
    case Opcode::kRotZ:
    case Opcode::kCnot:
    case Opcode::kCphase:
    case Opcode::kCrotX:
    case Opcode::kCrotY:
    case Opcode::kMov:
      return advance(ExecGate(instr));

    case Opcode::kMeas:
      return advance(ExecMeasure(instr));

    case Opcode::kCreateEpr:
      return advance(ExecCreateEpr(instr));
    case Opcode::kRecvEpr:
      return advance(ExecRecvEpr(instr));

    case Opcode::kWaitAll:
    case Opcode::kWaitAny:
    case Opcode::kWaitSingle:
      return advance(ExecWait(instr));

    case Opcode::kSend:
      return advance(ExecSend(instr));
    case Opcode::kRecv:
      return advance(ExecRecv(instr));

    case Opcode::kRetReg:
    case Opcode::kRetArr:
      return advance(ExecReturn(state, instr));

    case Opcode::kRet:
      return Next{};

    case Opcode::kBreakpoint:
      return advance(ExecBreakpoint(state, instr));
  }
  common::ThrowInternalError(
      "Executor::ExecInstruction",
      fmt::format("unhandled opcode {}", static_cast<int>(instr.opcode)));
}

auto Executor::CheckAbort(const char* where) const -> Result<void> {
  if (abort_->IsRequested()) {
    return std::unexpected(
        Diagnostic::Aborted(fmt::format("aborted while waiting for {}", where)));
  }
  return {};
}

}  // namespace netqasm::vm
