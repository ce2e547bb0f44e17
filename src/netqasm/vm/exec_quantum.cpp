#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "netqasm/vm/executor.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::vm {

namespace {

auto ExecError(std::string msg) -> Diagnostic {
  return Diagnostic::Execution(UnknownSpan{}, std::move(msg));
}

auto ToEprType(int32_t value) -> Result<EprType> {
  switch (value) {
    case 0:
      return EprType::kCreateKeep;
    case 1:
      return EprType::kMeasureDirectly;
    case 2:
      return EprType::kRemoteStatePrep;
    default:
      return std::unexpected(
          ExecError(fmt::format("unknown entanglement type {}", value)));
  }
}

}  // namespace

auto Executor::QubitOf(const lang::Register& reg) const -> Result<int32_t> {
  return memory_->PhysicalQubit(memory_->GetRegister(reg));
}

auto Executor::ExecQAlloc(const lang::Instruction& instr) -> Result<void> {
  int32_t virtual_id = memory_->GetRegister(instr.Reg(0));
  if (memory_->HasQubit(virtual_id)) {
    return std::unexpected(
        ExecError(
            fmt::format("virtual qubit {} is already allocated", virtual_id)));
  }
  auto physical = processor_->AllocateQubit();
  if (!physical) {
    return std::unexpected(std::move(physical).error());
  }
  memory_->BindQubit(virtual_id, *physical);
  spdlog::debug("vm: qubit {} -> physical {}", virtual_id, *physical);
  return {};
}

auto Executor::ExecInit(const lang::Instruction& instr) -> Result<void> {
  auto physical = QubitOf(instr.Reg(0));
  if (!physical) {
    return std::unexpected(std::move(physical).error());
  }
  return processor_->InitQubit(*physical);
}

auto Executor::ExecQFree(const lang::Instruction& instr) -> Result<void> {
  int32_t virtual_id = memory_->GetRegister(instr.Reg(0));
  auto physical = memory_->PhysicalQubit(virtual_id);
  if (!physical) {
    return std::unexpected(std::move(physical).error());
  }
  auto freed = processor_->FreeQubit(*physical);
  if (!freed) {
    return freed;
  }
  memory_->UnbindQubit(virtual_id);
  return {};
}

auto Executor::ExecGate(const lang::Instruction& instr) -> Result<void> {
  auto gate = lang::OpcodeGate(instr.opcode);
  if (!gate) {
    common::ThrowInternalError("Executor::ExecGate", "not a gate opcode");
  }
  auto angle = lang::GetAngle(instr);

  auto first = QubitOf(instr.Reg(0));
  if (!first) {
    return std::unexpected(std::move(first).error());
  }
  if (!lang::IsTwoQubit(*gate)) {
    return processor_->ApplySingle(*gate, *first, angle);
  }

  auto second = QubitOf(instr.Reg(1));
  if (!second) {
    return std::unexpected(std::move(second).error());
  }
  if (*first == *second) {
    return std::unexpected(
        ExecError(
            fmt::format(
                "'{}' needs two distinct qubits", lang::ToString(*gate))));
  }
  return processor_->ApplyTwo(*gate, *first, *second, angle);
}

auto Executor::ExecMeasure(const lang::Instruction& instr) -> Result<void> {
  auto physical = QubitOf(instr.Reg(0));
  if (!physical) {
    return std::unexpected(std::move(physical).error());
  }
  auto outcome = processor_->Measure(*physical);
  if (!outcome) {
    return std::unexpected(std::move(outcome).error());
  }
  memory_->SetRegister(instr.Reg(1), *outcome);
  return {};
}

auto Executor::ExecCreateEpr(const lang::Instruction& instr) -> Result<void> {
  int32_t args_address = memory_->GetRegister(instr.Reg(3));
  auto args = memory_->GetArray(args_address);
  if (!args) {
    return std::unexpected(std::move(args).error());
  }
  const ArrayValues& values = **args;
  if (values.size() != static_cast<size_t>(kCreateFields)) {
    return std::unexpected(
        ExecError(
            fmt::format(
                "create arguments @{} must have {} entries, got {}",
                args_address, kCreateFields, values.size())));
  }

  auto field = [&](int32_t index, int32_t fallback) {
    return values[static_cast<size_t>(index)].value_or(fallback);
  };
  auto type = ToEprType(field(kCreateTypeField, 0));
  if (!type) {
    return std::unexpected(std::move(type).error());
  }

  EntanglementRequest request{
      .role = EprRole::kCreate,
      .remote_node = memory_->GetRegister(instr.Reg(0)),
      .socket = memory_->GetRegister(instr.Reg(1)),
      .type = *type,
      .number = field(kCreateNumberField, 1),
      .min_fidelity = field(kCreateMinFidelityField, 0),
      .arguments = {},
  };
  for (const auto& v : values) {
    request.arguments.push_back(v.value_or(0));
  }
  if (request.number < 1) {
    return std::unexpected(
        ExecError(
            fmt::format("number of pairs must be positive, got {}",
                        request.number)));
  }

  return RequestPairs(
      request, memory_->GetRegister(instr.Reg(2)),
      memory_->GetRegister(instr.Reg(4)));
}

auto Executor::ExecRecvEpr(const lang::Instruction& instr) -> Result<void> {
  int32_t results_address = memory_->GetRegister(instr.Reg(3));
  auto results = memory_->GetArray(results_address);
  if (!results) {
    return std::unexpected(std::move(results).error());
  }
  auto pairs = static_cast<int32_t>((*results)->size() / kEntInfoFields);
  if (pairs < 1) {
    return std::unexpected(
        ExecError(
            fmt::format(
                "result array @{} is too short for one pair", results_address)));
  }

  EntanglementRequest request{
      .role = EprRole::kReceive,
      .remote_node = memory_->GetRegister(instr.Reg(0)),
      .socket = memory_->GetRegister(instr.Reg(1)),
      .type = EprType::kCreateKeep,
      .number = pairs,
      .min_fidelity = 0,
      .arguments = {},
  };
  return RequestPairs(
      request, memory_->GetRegister(instr.Reg(2)), results_address);
}

auto Executor::RequestPairs(
    const EntanglementRequest& request, int32_t qubit_array,
    int32_t results_array) -> Result<void> {
  auto results = memory_->GetArray(results_array);
  if (!results) {
    return std::unexpected(std::move(results).error());
  }
  auto needed = static_cast<size_t>(request.number) * kEntInfoFields;
  if ((*results)->size() < needed) {
    return std::unexpected(
        ExecError(
            fmt::format(
                "result array @{} holds {} entries, {} pairs need {}",
                results_array, (*results)->size(), request.number, needed)));
  }

  // Virtual ids are resolved before the processor hands out any qubit.
  bool keeps = KeepsQubits(request);
  std::vector<int32_t> virtual_ids;
  if (keeps) {
    auto ids = ResolvePairQubits(qubit_array, request.number);
    if (!ids) {
      return std::unexpected(std::move(ids).error());
    }
    virtual_ids = std::move(*ids);
  }

  auto ready = CheckAbort("entanglement");
  if (!ready) {
    return ready;
  }
  spdlog::debug(
      "vm: requesting {} pair(s) with node {} on socket {}", request.number,
      request.remote_node, request.socket);
  auto pairs = processor_->RequestEntanglement(request, *abort_);
  if (!pairs) {
    return std::unexpected(std::move(pairs).error());
  }
  auto aborted = CheckAbort("entanglement");
  if (!aborted) {
    ReleasePairs(*pairs);
    return aborted;
  }
  if (pairs->size() != static_cast<size_t>(request.number)) {
    ReleasePairs(*pairs);
    return std::unexpected(
        ExecError(
            fmt::format(
                "processor delivered {} pairs, {} were requested",
                pairs->size(), request.number)));
  }
  for (const auto& pair : *pairs) {
    if (pair.physical_qubit.has_value() != keeps) {
      ReleasePairs(*pairs);
      return std::unexpected(
          ExecError(
              keeps ? "processor delivered a pair without a local qubit"
                    : "processor kept a qubit for a measured pair"));
    }
  }

  for (size_t i = 0; i < pairs->size(); ++i) {
    const auto& pair = (*pairs)[i];
    auto base = static_cast<int32_t>(i) * kEntInfoFields;
    for (int32_t f = 0; f < kEntInfoFields; ++f) {
      auto stored = memory_->SetEntry(
          results_array, base + f, pair.info[static_cast<size_t>(f)]);
      if (!stored) {
        ReleasePairs(*pairs);
        return stored;
      }
    }
  }
  for (size_t i = 0; i < virtual_ids.size(); ++i) {
    memory_->BindQubit(virtual_ids[i], *(*pairs)[i].physical_qubit);
  }
  return {};
}

auto Executor::ResolvePairQubits(int32_t qubit_array, int32_t number) const
    -> Result<std::vector<int32_t>> {
  std::vector<int32_t> ids;
  for (int32_t i = 0; i < number; ++i) {
    auto entry = memory_->GetEntry(qubit_array, i);
    if (!entry) {
      return std::unexpected(std::move(entry).error());
    }
    if (!*entry) {
      return std::unexpected(
          ExecError(
              fmt::format(
                  "qubit array @{} has no virtual id for pair {}", qubit_array,
                  i)));
    }
    int32_t id = **entry;
    if (memory_->HasQubit(id)) {
      return std::unexpected(
          ExecError(fmt::format("virtual qubit {} is already allocated", id)));
    }
    if (std::ranges::find(ids, id) != ids.end()) {
      return std::unexpected(
          ExecError(
              fmt::format(
                  "virtual qubit {} is named twice in qubit array @{}", id,
                  qubit_array)));
    }
    ids.push_back(id);
  }
  return ids;
}

void Executor::ReleasePairs(const std::vector<EntangledPair>& pairs) {
  for (const auto& pair : pairs) {
    if (!pair.physical_qubit) {
      continue;
    }
    auto freed = processor_->FreeQubit(*pair.physical_qubit);
    if (!freed) {
      spdlog::warn(
          "vm: could not release physical qubit {}: {}", *pair.physical_qubit,
          freed.error().Message());
    }
  }
}

auto Executor::ExecSend(const lang::Instruction& instr) -> Result<void> {
  int32_t peer = memory_->GetRegister(instr.Reg(0));
  auto value = static_cast<uint32_t>(memory_->GetRegister(instr.Reg(1)));
  std::array<uint8_t, 4> message{};
  for (size_t i = 0; i < message.size(); ++i) {
    message[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
  }
  return processor_->Send(peer, message);
}

auto Executor::ExecRecv(const lang::Instruction& instr) -> Result<void> {
  int32_t peer = memory_->GetRegister(instr.Reg(0));
  auto ready = CheckAbort("a message");
  if (!ready) {
    return ready;
  }
  auto message = processor_->Receive(peer, *abort_);
  auto aborted = CheckAbort("a message");
  if (!aborted) {
    return aborted;
  }
  if (!message) {
    return std::unexpected(std::move(message).error());
  }
  if (message->size() != 4) {
    return std::unexpected(
        ExecError(
            fmt::format(
                "expected a 4-byte message from {}, got {} bytes", peer,
                message->size())));
  }
  uint32_t value = 0;
  for (size_t i = 0; i < 4; ++i) {
    value |= static_cast<uint32_t>((*message)[i]) << (8 * i);
  }
  memory_->SetRegister(instr.Reg(1), static_cast<int32_t>(value));
  return {};
}

auto Executor::ExecBreakpoint(
    const ExecState& state, const lang::Instruction& instr) -> Result<void> {
  BreakpointSnapshot snapshot{
      .pc = state.pc,
      .action = static_cast<uint8_t>(instr.Imm(0)),
      .role = static_cast<uint8_t>(instr.Imm(1)),
      .registers = memory_->Registers(),
      .arrays = memory_->Arrays(),
      .qubits = memory_->Qubits(),
  };
  processor_->Breakpoint(snapshot);
  return {};
}

}  // namespace netqasm::vm
