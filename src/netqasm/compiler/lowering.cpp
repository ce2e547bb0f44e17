#include "netqasm/compiler/lowering.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "absl/container/flat_hash_map.h"
#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/host_line.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/compiler/operation.hpp"
#include "netqasm/compiler/virtual_program.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::compiler {

namespace {

using lang::Opcode;
using lang::RegisterBank;

// Decomposition tables only nest a couple of levels deep.
constexpr int kMaxDecompositionDepth = 8;

auto CompileError(const HostLine& line, std::string msg) -> Diagnostic {
  return Diagnostic::Compile(HostSpan{.host_line = line}, std::move(msg));
}

auto NegatedBranch(CompareOp compare) -> Opcode {
  switch (compare) {
    case CompareOp::kEq:
      return Opcode::kBne;
    case CompareOp::kNe:
      return Opcode::kBeq;
    case CompareOp::kLt:
      return Opcode::kBge;
    case CompareOp::kGe:
      return Opcode::kBlt;
  }
  common::ThrowInternalError("NegatedBranch", "unknown comparison");
}

auto BinaryOpcode(BinaryKind kind) -> Opcode {
  switch (kind) {
    case BinaryKind::kAdd:
      return Opcode::kAdd;
    case BinaryKind::kSub:
      return Opcode::kSub;
    case BinaryKind::kMul:
      return Opcode::kMul;
  }
  common::ThrowInternalError("BinaryOpcode", "unknown binary operation");
}

class Lowerer {
 public:
  Lowerer(const flavour::Flavour& flavour, std::set<int32_t> live_qubits)
      : flavour_(flavour), live_qubits_(std::move(live_qubits)) {
  }

  auto LowerTopLevel(const std::vector<Operation>& ops) -> Result<void> {
    for (const auto& op : ops) {
      // Qubit registers are set before the outermost operation that uses
      // them, so they hold their id on every path through nested blocks.
      std::vector<int32_t> qubits;
      CollectQubits(op, qubits);
      for (int32_t virtual_id : qubits) {
        if (qubit_regs_.contains(virtual_id)) {
          continue;
        }
        auto reg = NewVReg(RegisterBank::kQ);
        qubit_regs_.emplace(virtual_id, reg);
        Emit(Opcode::kSet, {reg, lang::Immediate{virtual_id}}, op.host_line);
      }
      auto lowered = LowerOp(op);
      if (!lowered) {
        return lowered;
      }
    }
    return {};
  }

  auto PublishFutures(const LoweringInput& input, LoweredProgram& out)
      -> Result<void> {
    for (const auto& [future, value] : input.value_futures) {
      auto reg = ReadValue(value, std::nullopt);
      if (!reg) {
        return std::unexpected(std::move(reg).error());
      }
      Emit(Opcode::kRetReg, {*reg}, std::nullopt);
      out.register_futures.emplace_back(future, *reg);
    }
    for (const auto& [future, array] : input.array_futures) {
      auto it = addresses_.find(array);
      if (it == addresses_.end()) {
        return std::unexpected(
            Diagnostic::Compile(
                UnknownSpan{},
                fmt::format(
                    "array {} is not created in this subroutine",
                    array.value)));
      }
      Emit(Opcode::kRetArr, {lang::Address{it->second}}, std::nullopt);
      out.array_futures.emplace_back(future, it->second);
    }
    return {};
  }

  auto TakeProgram() -> VProgram {
    program_.num_vregs = next_vreg_;
    return std::move(program_);
  }

 private:
  void CollectQubits(const Operation& op, std::vector<int32_t>& out) const {
    std::visit(
        Overloaded{
            [&](const AllocQubitOp& o) { out.push_back(o.qubit.virtual_id); },
            [&](const FreeQubitOp& o) { out.push_back(o.qubit.virtual_id); },
            [&](const GateOp& o) {
              out.push_back(o.first.virtual_id);
              if (o.second) {
                out.push_back(o.second->virtual_id);
                if (NeedsElectron(o)) {
                  out.push_back(*flavour_.electron_virtual_id);
                }
              }
            },
            [&](const MeasureOp& o) { out.push_back(o.qubit.virtual_id); },
            [&](const IfOp& o) {
              for (const auto& nested : o.then_body) {
                CollectQubits(nested, out);
              }
              for (const auto& nested : o.else_body) {
                CollectQubits(nested, out);
              }
            },
            [&](const LoopOp& o) {
              for (const auto& nested : o.body) {
                CollectQubits(nested, out);
              }
            },
            [](const auto&) {},
        },
        op.data);
  }

  // A two-qubit gate routed through the communication qubit.
  [[nodiscard]] auto NeedsElectron(const GateOp& op) const -> bool {
    if (!op.second || flavour_.IsNative(op.gate) ||
        !flavour_.electron_virtual_id) {
      return false;
    }
    return TopologyOf(op.first.virtual_id, op.second->virtual_id) ==
           flavour::Topology::kCarbonCarbon;
  }

  [[nodiscard]] auto TopologyOf(int32_t first, int32_t second) const
      -> flavour::Topology {
    if (!flavour_.electron_virtual_id) {
      return flavour::Topology::kCarbonCarbon;
    }
    int32_t electron = *flavour_.electron_virtual_id;
    if (first == electron) {
      return flavour::Topology::kElectronCarbon;
    }
    if (second == electron) {
      return flavour::Topology::kCarbonElectron;
    }
    return flavour::Topology::kCarbonCarbon;
  }

  auto NewVReg(RegisterBank bank) -> VReg {
    return VReg{.bank = bank, .id = next_vreg_++};
  }

  void Emit(
      Opcode opcode, std::vector<VOperand> operands,
      const std::optional<HostLine>& line) {
    program_.instrs.push_back(
        VInstr{
            .opcode = opcode,
            .operands = std::move(operands),
            .host_line = line,
        });
  }

  void PlaceLabel(std::string name) {
    program_.labels.push_back(
        VLabel{
            .name = std::move(name),
            .index = static_cast<uint32_t>(program_.instrs.size()),
        });
  }

  [[nodiscard]] auto Here() const -> uint32_t {
    return static_cast<uint32_t>(program_.instrs.size());
  }

  auto Constant(int32_t value, const HostLine& line) -> VReg {
    auto reg = NewVReg(RegisterBank::kR);
    Emit(Opcode::kSet, {reg, lang::Immediate{value}}, line);
    return reg;
  }

  auto DefineValue(ValueId value, RegisterBank bank) -> VReg {
    auto [it, inserted] = values_.try_emplace(value, VReg{});
    if (inserted) {
      it->second = NewVReg(bank);
    }
    return it->second;
  }

  auto ReadValue(ValueId value, const std::optional<HostLine>& line)
      -> Result<VReg> {
    auto it = values_.find(value);
    if (it == values_.end()) {
      auto span = line ? DiagSpan{HostSpan{.host_line = *line}}
                       : DiagSpan{UnknownSpan{}};
      return std::unexpected(
          Diagnostic::Compile(
              span,
              fmt::format("value {} is read before it is defined", value.value)));
    }
    return it->second;
  }

  auto Operand(const ValueOrConst& operand, const HostLine& line)
      -> Result<VReg> {
    if (const auto* constant = std::get_if<int32_t>(&operand)) {
      return Constant(*constant, line);
    }
    return ReadValue(std::get<ValueId>(operand), line);
  }

  auto QubitReg(int32_t virtual_id) const -> VReg {
    auto it = qubit_regs_.find(virtual_id);
    if (it == qubit_regs_.end()) {
      common::ThrowInternalError(
          "Lowerer::QubitReg",
          fmt::format("qubit {} has no register", virtual_id));
    }
    return it->second;
  }

  auto AllocateAddress(const HostLine& line) -> Result<int32_t> {
    if (next_address_ >= flavour_.array_address_limit) {
      return std::unexpected(
          Diagnostic::Layout(
              HostSpan{.host_line = line},
              fmt::format(
                  "array budget of {} addresses exceeded",
                  flavour_.array_address_limit)));
    }
    return next_address_++;
  }

  auto ArrayAddress(ArrayId array, const HostLine& line) -> Result<int32_t> {
    auto it = addresses_.find(array);
    if (it == addresses_.end()) {
      return std::unexpected(
          CompileError(
              line,
              fmt::format(
                  "array {} is used before it is created", array.value)));
    }
    return it->second;
  }

  auto CreateArray(ArrayId array, int32_t length, const HostLine& line)
      -> Result<int32_t> {
    auto address = AllocateAddress(line);
    if (!address) {
      return address;
    }
    addresses_.insert_or_assign(array, *address);
    auto len = Constant(length, line);
    Emit(Opcode::kArray, {len, lang::Address{*address}}, line);
    return *address;
  }

  void StoreConstant(
      int32_t address, int32_t index, int32_t value, const HostLine& line) {
    auto v = Constant(value, line);
    auto i = Constant(index, line);
    Emit(
        Opcode::kStore,
        {v, VEntry{.address = lang::Address{address}, .index = i}}, line);
  }

  auto LowerBody(const std::vector<Operation>& ops) -> Result<void> {
    for (const auto& op : ops) {
      auto lowered = LowerOp(op);
      if (!lowered) {
        return lowered;
      }
    }
    return {};
  }

  auto LowerOp(const Operation& op) -> Result<void> {
    const HostLine& line = op.host_line;
    return std::visit(
        Overloaded{
            [&](const AllocQubitOp& o) -> Result<void> {
              auto q = QubitReg(o.qubit.virtual_id);
              Emit(Opcode::kQAlloc, {q}, line);
              Emit(Opcode::kInit, {q}, line);
              live_qubits_.insert(o.qubit.virtual_id);
              return {};
            },
            [&](const FreeQubitOp& o) -> Result<void> {
              Emit(Opcode::kQFree, {QubitReg(o.qubit.virtual_id)}, line);
              live_qubits_.erase(o.qubit.virtual_id);
              return {};
            },
            [&](const GateOp& o) -> Result<void> {
              std::optional<int32_t> second;
              if (o.second) {
                second = o.second->virtual_id;
              }
              return LowerGate(
                  o.gate, o.first.virtual_id, second, o.angle, line, 0);
            },
            [&](const MeasureOp& o) -> Result<void> {
              auto outcome = DefineValue(o.result, RegisterBank::kM);
              Emit(
                  Opcode::kMeas, {QubitReg(o.qubit.virtual_id), outcome},
                  line);
              return {};
            },
            [&](const SetValueOp& o) -> Result<void> {
              auto reg = DefineValue(o.result, RegisterBank::kR);
              Emit(Opcode::kSet, {reg, lang::Immediate{o.value}}, line);
              return {};
            },
            [&](const BinaryOp& o) -> Result<void> {
              auto lhs = Operand(o.lhs, line);
              if (!lhs) {
                return std::unexpected(std::move(lhs).error());
              }
              auto rhs = Operand(o.rhs, line);
              if (!rhs) {
                return std::unexpected(std::move(rhs).error());
              }
              auto dest = DefineValue(o.result, RegisterBank::kR);
              Emit(BinaryOpcode(o.kind), {dest, *lhs, *rhs}, line);
              return {};
            },
            [&](const CreateArrayOp& o) -> Result<void> {
              auto address = CreateArray(o.array, o.length, line);
              if (!address) {
                return std::unexpected(std::move(address).error());
              }
              return {};
            },
            [&](const StoreOp& o) -> Result<void> {
              return LowerStore(o, line);
            },
            [&](const LoadOp& o) -> Result<void> { return LowerLoad(o, line); },
            [&](const EprOp& o) -> Result<void> { return LowerEpr(o, line); },
            [&](const SendOp& o) -> Result<void> {
              auto peer = Constant(o.peer, line);
              auto value = Operand(o.value, line);
              if (!value) {
                return std::unexpected(std::move(value).error());
              }
              Emit(Opcode::kSend, {peer, *value}, line);
              return {};
            },
            [&](const RecvOp& o) -> Result<void> {
              auto peer = Constant(o.peer, line);
              auto dest = DefineValue(o.result, RegisterBank::kR);
              Emit(Opcode::kRecv, {peer, dest}, line);
              return {};
            },
            [&](const BreakpointOp& o) -> Result<void> {
              Emit(
                  Opcode::kBreakpoint,
                  {lang::Immediate{static_cast<int32_t>(o.action)},
                   lang::Immediate{static_cast<int32_t>(o.role)}},
                  line);
              return {};
            },
            [&](const IfOp& o) -> Result<void> { return LowerIf(o, line); },
            [&](const LoopOp& o) -> Result<void> {
              return LowerLoop(o, line);
            },
        },
        op.data);
  }

  auto LowerStore(const StoreOp& op, const HostLine& line) -> Result<void> {
    auto address = ArrayAddress(op.array, line);
    if (!address) {
      return std::unexpected(std::move(address).error());
    }
    auto value = Operand(op.value, line);
    if (!value) {
      return std::unexpected(std::move(value).error());
    }
    auto index = Operand(op.index, line);
    if (!index) {
      return std::unexpected(std::move(index).error());
    }
    Emit(
        Opcode::kStore,
        {*value, VEntry{.address = lang::Address{*address}, .index = *index}},
        line);
    return {};
  }

  auto LowerLoad(const LoadOp& op, const HostLine& line) -> Result<void> {
    auto address = ArrayAddress(op.array, line);
    if (!address) {
      return std::unexpected(std::move(address).error());
    }
    auto index = Operand(op.index, line);
    if (!index) {
      return std::unexpected(std::move(index).error());
    }
    auto dest = DefineValue(op.result, RegisterBank::kR);
    Emit(
        Opcode::kLoad,
        {dest, VEntry{.address = lang::Address{*address}, .index = *index}},
        line);
    return {};
  }

  auto LowerEpr(const EprOp& op, const HostLine& line) -> Result<void> {
    auto results =
        CreateArray(op.results, op.number * vm::kEntInfoFields, line);
    if (!results) {
      return std::unexpected(std::move(results).error());
    }

    auto qubit_array = AllocateAddress(line);
    if (!qubit_array) {
      return std::unexpected(std::move(qubit_array).error());
    }
    auto qubit_count = Constant(static_cast<int32_t>(op.qubits.size()), line);
    Emit(Opcode::kArray, {qubit_count, lang::Address{*qubit_array}}, line);
    for (size_t i = 0; i < op.qubits.size(); ++i) {
      StoreConstant(
          *qubit_array, static_cast<int32_t>(i), op.qubits[i].virtual_id,
          line);
    }

    std::optional<int32_t> args_array;
    if (op.role == vm::EprRole::kCreate) {
      auto address = AllocateAddress(line);
      if (!address) {
        return std::unexpected(std::move(address).error());
      }
      args_array = *address;
      auto fields = Constant(vm::kCreateFields, line);
      Emit(Opcode::kArray, {fields, lang::Address{*args_array}}, line);
      StoreConstant(
          *args_array, vm::kCreateTypeField, static_cast<int32_t>(op.type),
          line);
      StoreConstant(*args_array, vm::kCreateNumberField, op.number, line);
      StoreConstant(
          *args_array, vm::kCreateMinFidelityField, op.min_fidelity, line);
    }

    auto remote = Constant(op.remote_node, line);
    auto socket = Constant(op.socket, line);
    auto qubit_addr = NewVReg(RegisterBank::kR);
    Emit(Opcode::kLea, {qubit_addr, lang::Address{*qubit_array}}, line);
    auto results_addr = NewVReg(RegisterBank::kR);
    Emit(Opcode::kLea, {results_addr, lang::Address{*results}}, line);

    if (args_array) {
      auto args_addr = NewVReg(RegisterBank::kR);
      Emit(Opcode::kLea, {args_addr, lang::Address{*args_array}}, line);
      Emit(
          Opcode::kCreateEpr,
          {remote, socket, qubit_addr, args_addr, results_addr}, line);
    } else {
      Emit(Opcode::kRecvEpr, {remote, socket, qubit_addr, results_addr}, line);
    }

    auto start = Constant(0, line);
    auto stop = Constant(op.number * vm::kEntInfoFields, line);
    Emit(
        Opcode::kWaitAll,
        {VSlice{
            .address = lang::Address{*results},
            .start = start,
            .stop = stop,
        }},
        line);

    for (const auto& qubit : op.qubits) {
      live_qubits_.insert(qubit.virtual_id);
    }
    return {};
  }

  auto LowerIf(const IfOp& op, const HostLine& line) -> Result<void> {
    auto lhs = ReadValue(op.lhs, line);
    if (!lhs) {
      return std::unexpected(std::move(lhs).error());
    }
    auto rhs = Operand(op.rhs, line);
    if (!rhs) {
      return std::unexpected(std::move(rhs).error());
    }
    uint32_t k = if_count_++;
    auto else_label = fmt::format("ELSE_{}", k);
    auto end_label = fmt::format("END_{}", k);

    Emit(
        NegatedBranch(op.compare), {*lhs, *rhs, lang::LabelRef{else_label}},
        line);
    auto then_result = LowerBody(op.then_body);
    if (!then_result) {
      return then_result;
    }
    Emit(Opcode::kJmp, {lang::LabelRef{end_label}}, line);
    PlaceLabel(else_label);
    auto else_result = LowerBody(op.else_body);
    if (!else_result) {
      return else_result;
    }
    PlaceLabel(end_label);
    return {};
  }

  auto LowerLoop(const LoopOp& op, const HostLine& line) -> Result<void> {
    uint32_t k = loop_count_++;
    auto loop_label = fmt::format("LOOP_{}", k);
    auto exit_label = fmt::format("LOOP_EXIT_{}", k);

    auto counter = DefineValue(op.counter, RegisterBank::kR);
    Emit(Opcode::kSet, {counter, lang::Immediate{0}}, line);
    auto bound = Constant(op.iterations, line);
    auto one = Constant(1, line);

    PlaceLabel(loop_label);
    uint32_t begin = Here();
    Emit(
        Opcode::kBeq, {counter, bound, lang::LabelRef{exit_label}}, line);
    auto body = LowerBody(op.body);
    if (!body) {
      return body;
    }
    Emit(Opcode::kAdd, {counter, counter, one}, line);
    uint32_t end = Here();
    Emit(Opcode::kJmp, {lang::LabelRef{loop_label}}, line);
    PlaceLabel(exit_label);
    program_.loops.push_back(LoopRegion{.begin = begin, .end = end});
    return {};
  }

  auto LowerGate(
      lang::Gate gate, int32_t first, std::optional<int32_t> second,
      std::optional<lang::Angle> angle, const HostLine& line, int depth)
      -> Result<void> {
    if (depth > kMaxDecompositionDepth) {
      common::ThrowInternalError(
          "Lowerer::LowerGate",
          fmt::format(
              "decomposition of '{}' does not terminate", lang::ToString(gate)));
    }
    if (lang::IsTwoQubit(gate)) {
      if (!second) {
        common::ThrowInternalError(
            "Lowerer::LowerGate", "two-qubit gate without a second qubit");
      }
      if (first == *second) {
        return std::unexpected(
            CompileError(
                line, fmt::format(
                          "'{}' needs two distinct qubits, got {} twice",
                          lang::ToString(gate), first)));
      }
    }

    if (flavour_.IsNative(gate)) {
      EmitGate(gate, first, second, angle, line);
      return {};
    }

    auto topology = second ? TopologyOf(first, *second)
                           : flavour::Topology::kSingle;
    const auto* steps = flavour_.FindDecomposition(gate, topology);
    if (steps == nullptr) {
      return std::unexpected(
          Diagnostic::Unsupported(
              HostSpan{.host_line = line},
              fmt::format(
                  "gate '{}' is not supported by flavour '{}'",
                  lang::ToString(gate), flavour_.name)));
    }
    spdlog::debug(
        "compiler: decomposing '{}' into {} step(s) for flavour {}",
        lang::ToString(gate), steps->size(), flavour_.name);

    auto resolve = [&](flavour::StepQubit which) -> Result<int32_t> {
      switch (which) {
        case flavour::StepQubit::kFirst:
          return first;
        case flavour::StepQubit::kSecond:
          if (!second) {
            common::ThrowInternalError(
                "Lowerer::LowerGate", "single-qubit step uses a second qubit");
          }
          return *second;
        case flavour::StepQubit::kElectron: {
          int32_t electron = *flavour_.electron_virtual_id;
          if (!live_qubits_.contains(electron)) {
            return std::unexpected(
                CompileError(
                    line,
                    fmt::format(
                        "'{}' between qubits {} and {} is routed through "
                        "qubit {}, which is not allocated",
                        lang::ToString(gate), first, second.value_or(-1),
                        electron)));
          }
          return electron;
        }
      }
      common::ThrowInternalError("Lowerer::LowerGate", "unknown step qubit");
    };

    for (const auto& step : *steps) {
      auto q0 = resolve(step.qubit);
      if (!q0) {
        return std::unexpected(std::move(q0).error());
      }
      std::optional<int32_t> q1;
      if (lang::IsTwoQubit(step.gate)) {
        auto other = resolve(step.other);
        if (!other) {
          return std::unexpected(std::move(other).error());
        }
        q1 = *other;
      }
      std::optional<lang::Angle> step_angle;
      if (lang::IsParameterized(step.gate)) {
        step_angle = lang::Angle{
            .num = step.angle_num, .denom_exp = flavour_.step_denom_exp};
      }
      auto lowered = LowerGate(step.gate, *q0, q1, step_angle, line, depth + 1);
      if (!lowered) {
        return lowered;
      }
    }
    return {};
  }

  void EmitGate(
      lang::Gate gate, int32_t first, std::optional<int32_t> second,
      std::optional<lang::Angle> angle, const HostLine& line) {
    std::vector<VOperand> operands{QubitReg(first)};
    if (second) {
      operands.emplace_back(QubitReg(*second));
    }
    if (lang::IsParameterized(gate)) {
      auto canonical = flavour_.CanonicalAngle(angle.value_or(lang::Angle{}));
      operands.emplace_back(lang::Immediate{canonical.num});
      operands.emplace_back(lang::Immediate{canonical.denom_exp});
    }
    Emit(lang::GateOpcode(gate), std::move(operands), line);
  }

  const flavour::Flavour& flavour_;
  std::set<int32_t> live_qubits_;
  VProgram program_;
  uint32_t next_vreg_ = 0;
  int32_t next_address_ = 0;
  uint32_t if_count_ = 0;
  uint32_t loop_count_ = 0;
  absl::flat_hash_map<int32_t, VReg> qubit_regs_;
  absl::flat_hash_map<ValueId, VReg> values_;
  absl::flat_hash_map<ArrayId, int32_t> addresses_;
};

}  // namespace

auto Lower(const LoweringInput& input, const flavour::Flavour& flavour)
    -> Result<LoweredProgram> {
  if (input.operations == nullptr) {
    common::ThrowInternalError("Lower", "no operations to lower");
  }
  Lowerer lowerer(flavour, input.live_qubits);
  auto lowered = lowerer.LowerTopLevel(*input.operations);
  if (!lowered) {
    return std::unexpected(std::move(lowered).error());
  }
  LoweredProgram out;
  auto published = lowerer.PublishFutures(input, out);
  if (!published) {
    return std::unexpected(std::move(published).error());
  }
  out.program = lowerer.TakeProgram();
  spdlog::debug(
      "compiler: lowered to {} virtual instructions using {} virtual registers",
      out.program.instrs.size(), out.program.num_vregs);
  return out;
}

}  // namespace netqasm::compiler
