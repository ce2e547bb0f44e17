#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/lang/subroutine.hpp"
#include "netqasm/vm/abort_signal.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::flavour {
struct Flavour;
}

namespace netqasm::vm {

enum class ExecStatus {
  kRunning,
  kReturned,
};

// Values published by ret_reg and ret_arr during one subroutine.
struct ReturnedValues {
  std::map<lang::Register, int32_t> registers;
  std::map<int32_t, ArrayValues> arrays;
};

// Progress of one subroutine. After a failure `pc` still points at the
// faulting instruction.
struct ExecState {
  const lang::Subroutine* subroutine = nullptr;
  uint32_t pc = 0;
  ExecStatus status = ExecStatus::kRunning;
  uint64_t steps = 0;
  ReturnedValues returned;
};

// Interprets subroutines against an application's memory, dispatching
// quantum, network and messaging effects to the processor. All pointers are
// non-null and must outlive the executor.
class Executor {
 public:
  Executor(
      const flavour::Flavour* flavour, Processor* processor, AppMemory* memory,
      const AbortSignal* abort)
      : flavour_(flavour),
        processor_(processor),
        memory_(memory),
        abort_(abort) {
  }

  // Runs `state.subroutine` from `state.pc` until `ret` or the end.
  auto Run(ExecState& state) -> Result<ExecStatus>;

  // Convenience: runs a whole subroutine and returns what it published.
  auto Execute(const lang::Subroutine& subroutine) -> Result<ReturnedValues>;

 private:
  // Next program counter, or nullopt when the instruction returns.
  using Next = std::optional<uint32_t>;

  auto ExecInstruction(ExecState& state, const lang::Instruction& instr)
      -> Result<Next>;

  // exec_classical.cpp
  auto ExecSet(const lang::Instruction& instr) -> Result<void>;
  auto ExecArithmetic(const lang::Instruction& instr) -> Result<void>;
  auto ExecModular(const lang::Instruction& instr) -> Result<void>;
  auto ExecBranch(const ExecState& state, const lang::Instruction& instr)
      -> Result<Next>;
  auto ExecArray(const lang::Instruction& instr) -> Result<void>;
  auto ExecLoadStore(const lang::Instruction& instr) -> Result<void>;
  auto ExecUndef(const lang::Instruction& instr) -> Result<void>;
  auto ExecLea(const lang::Instruction& instr) -> Result<void>;
  auto ExecWait(const lang::Instruction& instr) -> Result<void>;
  auto ExecReturn(ExecState& state, const lang::Instruction& instr)
      -> Result<void>;

  // exec_quantum.cpp
  auto ExecQAlloc(const lang::Instruction& instr) -> Result<void>;
  auto ExecInit(const lang::Instruction& instr) -> Result<void>;
  auto ExecQFree(const lang::Instruction& instr) -> Result<void>;
  auto ExecGate(const lang::Instruction& instr) -> Result<void>;
  auto ExecMeasure(const lang::Instruction& instr) -> Result<void>;
  auto ExecCreateEpr(const lang::Instruction& instr) -> Result<void>;
  auto ExecRecvEpr(const lang::Instruction& instr) -> Result<void>;
  auto ExecSend(const lang::Instruction& instr) -> Result<void>;
  auto ExecRecv(const lang::Instruction& instr) -> Result<void>;
  auto ExecBreakpoint(const ExecState& state, const lang::Instruction& instr)
      -> Result<void>;

  // Shared by create_epr and recv_epr: checks the destination arrays, asks
  // the processor for pairs and commits the results in one step.
  auto RequestPairs(
      const EntanglementRequest& request, int32_t qubit_array,
      int32_t results_array) -> Result<void>;
  // The `number` distinct, unallocated virtual ids at the head of
  // `qubit_array`.
  auto ResolvePairQubits(int32_t qubit_array, int32_t number) const
      -> Result<std::vector<int32_t>>;
  // Hands the local halves of undelivered pairs back to the processor.
  void ReleasePairs(const std::vector<EntangledPair>& pairs);

  auto QubitOf(const lang::Register& reg) const -> Result<int32_t>;
  auto CheckAbort(const char* where) const -> Result<void>;

  const flavour::Flavour* flavour_;
  Processor* processor_;
  AppMemory* memory_;
  const AbortSignal* abort_;
};

}  // namespace netqasm::vm
