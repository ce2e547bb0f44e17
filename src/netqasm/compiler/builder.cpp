#include "netqasm/compiler/builder.hpp"

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

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/host_line.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/compiler/compiler.hpp"
#include "netqasm/compiler/lowering.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::compiler {

namespace {

auto SpanOf(const std::source_location& loc) -> DiagSpan {
  return HostSpan{.host_line = HostLine::FromSourceLocation(loc)};
}

auto KeepsQubit(vm::EprRole role, vm::EprType type) -> bool {
  switch (type) {
    case vm::EprType::kCreateKeep:
      return true;
    case vm::EprType::kMeasureDirectly:
      return false;
    case vm::EprType::kRemoteStatePrep:
      return role == vm::EprRole::kReceive;
  }
  return false;
}

}  // namespace

Builder::Builder(const flavour::Flavour& flavour, BuilderOptions options)
    : flavour_(flavour), options_(options) {
}

auto Builder::Body() -> std::vector<Operation>& {
  if (scopes_.empty()) {
    return root_;
  }
  auto& scope = scopes_.back();
  if (auto* if_op = std::get_if<IfOp>(&scope.node.data)) {
    return scope.in_else ? if_op->else_body : if_op->then_body;
  }
  return std::get<LoopOp>(scope.node.data).body;
}

void Builder::Record(OperationData data, const Location& loc) {
  Body().push_back(
      Operation{
          .data = std::move(data),
          .host_line = HostLine::FromSourceLocation(loc),
      });
}

void Builder::Fail(const Location& loc, std::string msg) {
  // Later errors are usually consequences of the first one.
  if (!error_) {
    error_ = Diagnostic::Compile(SpanOf(loc), std::move(msg));
  }
}

auto Builder::LowestFreeVirtualId() const -> int32_t {
  std::set<int32_t> taken;
  for (const auto& info : qubits_) {
    if (info.allocated) {
      taken.insert(info.virtual_id);
    }
  }
  int32_t id = 0;
  while (taken.contains(id)) {
    ++id;
  }
  return id;
}

auto Builder::NewQubit() -> QubitId {
  QubitId id{static_cast<uint32_t>(qubits_.size())};
  qubits_.push_back(
      QubitInfo{.virtual_id = LowestFreeVirtualId(), .allocated = true});
  return id;
}

auto Builder::Ref(QubitId qubit, const Location& loc)
    -> std::optional<QubitRef> {
  if (qubit.value >= qubits_.size()) {
    Fail(loc, fmt::format("qubit {} was never allocated", qubit.value));
    return std::nullopt;
  }
  const auto& info = qubits_[qubit.value];
  if (!info.allocated) {
    Fail(
        loc, fmt::format(
                 "qubit {} is used after it was freed", qubit.value));
    return std::nullopt;
  }
  return QubitRef{.id = qubit, .virtual_id = info.virtual_id};
}

auto Builder::NewValue() -> ValueId {
  ValueId id{static_cast<uint32_t>(value_generation_.size())};
  value_generation_.push_back(generation_);
  return id;
}

auto Builder::CheckValue(ValueId value, const Location& loc) -> bool {
  if (value.value >= value_generation_.size()) {
    Fail(loc, fmt::format("value {} is read before it is defined", value.value));
    return false;
  }
  if (value_generation_[value.value] != generation_) {
    Fail(
        loc,
        fmt::format(
            "value {} belongs to an earlier subroutine; read its future "
            "instead",
            value.value));
    return false;
  }
  return true;
}

auto Builder::CheckOperand(const ValueOrConst& operand, const Location& loc)
    -> bool {
  if (const auto* value = std::get_if<ValueId>(&operand)) {
    return CheckValue(*value, loc);
  }
  return true;
}

auto Builder::CheckArray(ArrayId array, const Location& loc) -> bool {
  if (array.value >= array_generation_.size()) {
    Fail(loc, fmt::format("array {} was never created", array.value));
    return false;
  }
  if (array_generation_[array.value] != generation_) {
    Fail(
        loc,
        fmt::format(
            "array {} belongs to an earlier subroutine", array.value));
    return false;
  }
  return true;
}

auto Builder::AllocQubit(Location loc) -> QubitId {
  auto id = NewQubit();
  Record(AllocQubitOp{.qubit = *Ref(id, loc)}, loc);
  return id;
}

void Builder::Reallocate(QubitId qubit, Location loc) {
  if (qubit.value >= qubits_.size()) {
    Fail(loc, fmt::format("qubit {} was never allocated", qubit.value));
    return;
  }
  if (qubits_[qubit.value].allocated) {
    Fail(loc, fmt::format("qubit {} is already allocated", qubit.value));
    return;
  }
  int32_t virtual_id = LowestFreeVirtualId();
  qubits_[qubit.value] = QubitInfo{.virtual_id = virtual_id, .allocated = true};
  Record(
      AllocQubitOp{.qubit = QubitRef{.id = qubit, .virtual_id = virtual_id}},
      loc);
}

void Builder::FreeQubit(QubitId qubit, Location loc) {
  auto ref = Ref(qubit, loc);
  if (!ref) {
    return;
  }
  qubits_[qubit.value].allocated = false;
  Record(FreeQubitOp{.qubit = *ref}, loc);
}

void Builder::RecordGate(
    lang::Gate gate, QubitId first, std::optional<QubitId> second,
    std::optional<lang::Angle> angle, const Location& loc) {
  if (lang::IsTwoQubit(gate) != second.has_value()) {
    Fail(
        loc, fmt::format(
                 "'{}' takes {} qubit(s)", lang::ToString(gate),
                 lang::IsTwoQubit(gate) ? 2 : 1));
    return;
  }
  if (lang::IsParameterized(gate) != angle.has_value()) {
    Fail(
        loc, fmt::format(
                 "'{}' {} an angle", lang::ToString(gate),
                 angle ? "does not take" : "needs"));
    return;
  }
  if (angle && angle->denom_exp > lang::Angle::kMaxDenomExp) {
    Fail(
        loc, fmt::format(
                 "angle exponent {} exceeds {}", angle->denom_exp,
                 lang::Angle::kMaxDenomExp));
    return;
  }

  auto first_ref = Ref(first, loc);
  if (!first_ref) {
    return;
  }
  std::optional<QubitRef> second_ref;
  if (second) {
    second_ref = Ref(*second, loc);
    if (!second_ref) {
      return;
    }
  }
  Record(
      GateOp{
          .gate = gate,
          .first = *first_ref,
          .second = second_ref,
          .angle = angle,
      },
      loc);
}

auto Builder::Approximate(double radians, const Location& loc) -> lang::Angle {
  auto approx = lang::AngleFromRadians(radians, options_.angle_tolerance);
  if (!approx.exact) {
    warnings_.Warning(
        SpanOf(loc),
        fmt::format(
            "angle {} rad is not a multiple of pi/2^d for any d <= {} within "
            "{}; using {}*pi/2^{}",
            radians, lang::Angle::kMaxDenomExp, options_.angle_tolerance,
            approx.angle.num, approx.angle.denom_exp));
  }
  return approx.angle;
}

void Builder::Apply(lang::Gate gate, QubitId qubit, Location loc) {
  RecordGate(gate, qubit, std::nullopt, std::nullopt, loc);
}

void Builder::Apply(
    lang::Gate gate, QubitId control, QubitId target, Location loc) {
  RecordGate(gate, control, target, std::nullopt, loc);
}

void Builder::Rotate(
    lang::Gate gate, QubitId qubit, lang::Angle angle, Location loc) {
  RecordGate(gate, qubit, std::nullopt, angle, loc);
}

void Builder::RotateRadians(
    lang::Gate gate, QubitId qubit, double radians, Location loc) {
  RecordGate(gate, qubit, std::nullopt, Approximate(radians, loc), loc);
}

void Builder::ControlledRotate(
    lang::Gate gate, QubitId control, QubitId target, lang::Angle angle,
    Location loc) {
  RecordGate(gate, control, target, angle, loc);
}

void Builder::ControlledRotateRadians(
    lang::Gate gate, QubitId control, QubitId target, double radians,
    Location loc) {
  RecordGate(gate, control, target, Approximate(radians, loc), loc);
}

auto Builder::Measure(QubitId qubit, Location loc) -> MeasureResult {
  auto value = NewValue();
  Future future{FutureId{next_future_++}};
  auto ref = Ref(qubit, loc);
  if (ref) {
    Record(MeasureOp{.qubit = *ref, .result = value}, loc);
    value_futures_.emplace_back(future.id, value);
  }
  return MeasureResult{.value = value, .future = future};
}

auto Builder::Set(int32_t value, Location loc) -> ValueId {
  auto id = NewValue();
  Record(SetValueOp{.result = id, .value = value}, loc);
  return id;
}

auto Builder::Binary(
    BinaryKind kind, ValueOrConst lhs, ValueOrConst rhs, const Location& loc)
    -> ValueId {
  auto id = NewValue();
  if (CheckOperand(lhs, loc) && CheckOperand(rhs, loc)) {
    Record(
        BinaryOp{.kind = kind, .result = id, .lhs = lhs, .rhs = rhs}, loc);
  }
  return id;
}

auto Builder::Add(ValueOrConst lhs, ValueOrConst rhs, Location loc)
    -> ValueId {
  return Binary(BinaryKind::kAdd, lhs, rhs, loc);
}

auto Builder::Sub(ValueOrConst lhs, ValueOrConst rhs, Location loc)
    -> ValueId {
  return Binary(BinaryKind::kSub, lhs, rhs, loc);
}

auto Builder::Mul(ValueOrConst lhs, ValueOrConst rhs, Location loc)
    -> ValueId {
  return Binary(BinaryKind::kMul, lhs, rhs, loc);
}

auto Builder::NewArray(int32_t length, Location loc) -> ArrayId {
  ArrayId id{static_cast<uint32_t>(array_generation_.size())};
  array_generation_.push_back(generation_);
  if (length < 0) {
    Fail(loc, fmt::format("array length must not be negative, got {}", length));
    return id;
  }
  Record(CreateArrayOp{.array = id, .length = length}, loc);
  return id;
}

void Builder::Store(
    ArrayId array, ValueOrConst index, ValueOrConst value, Location loc) {
  if (CheckArray(array, loc) && CheckOperand(index, loc) &&
      CheckOperand(value, loc)) {
    Record(StoreOp{.array = array, .index = index, .value = value}, loc);
  }
}

auto Builder::Load(ArrayId array, ValueOrConst index, Location loc)
    -> ValueId {
  auto id = NewValue();
  if (CheckArray(array, loc) && CheckOperand(index, loc)) {
    Record(LoadOp{.result = id, .array = array, .index = index}, loc);
  }
  return id;
}

auto Builder::Epr(
    vm::EprRole role, const EprRequest& request, const Location& loc)
    -> EprResult {
  // The result array holds kEntInfoFields entries per pair and must fit one
  // application array.
  constexpr int32_t kMaxPairs =
      vm::AppMemory::kMaxArrayLength / vm::kEntInfoFields;

  ArrayId results{static_cast<uint32_t>(array_generation_.size())};
  array_generation_.push_back(generation_);
  EprResult out{
      .qubits = {},
      .info = ArrayFuture{.id = FutureId{next_future_++}, .length = 0},
  };
  if (request.number < 1 || request.number > kMaxPairs) {
    Fail(
        loc, fmt::format(
                 "number of pairs must be in [1, {}], got {}", kMaxPairs,
                 request.number));
    return out;
  }
  out.info.length = request.number * vm::kEntInfoFields;

  EprOp op{
      .role = role,
      .remote_node = request.remote_node,
      .socket = request.socket,
      .type = request.type,
      .number = request.number,
      .min_fidelity = request.min_fidelity,
      .qubits = {},
      .results = results,
  };
  if (KeepsQubit(role, request.type)) {
    for (int32_t i = 0; i < request.number; ++i) {
      auto qubit = NewQubit();
      out.qubits.push_back(qubit);
      op.qubits.push_back(*Ref(qubit, loc));
    }
  }
  Record(std::move(op), loc);
  array_futures_.emplace_back(out.info.id, results);
  return out;
}

auto Builder::CreateEpr(const EprRequest& request, Location loc)
    -> EprResult {
  return Epr(vm::EprRole::kCreate, request, loc);
}

auto Builder::RecvEpr(const EprRequest& request, Location loc) -> EprResult {
  return Epr(vm::EprRole::kReceive, request, loc);
}

void Builder::Send(int32_t peer, ValueOrConst value, Location loc) {
  if (CheckOperand(value, loc)) {
    Record(SendOp{.peer = peer, .value = value}, loc);
  }
}

auto Builder::Recv(int32_t peer, Location loc) -> ValueId {
  auto id = NewValue();
  Record(RecvOp{.peer = peer, .result = id}, loc);
  return id;
}

void Builder::Breakpoint(
    vm::BreakpointAction action, vm::BreakpointRole role, Location loc) {
  Record(BreakpointOp{.action = action, .role = role}, loc);
}

auto Builder::ReturnValue(ValueId value, Location loc) -> Future {
  Future future{FutureId{next_future_++}};
  if (CheckValue(value, loc)) {
    value_futures_.emplace_back(future.id, value);
  }
  return future;
}

auto Builder::ReturnArray(ArrayId array, Location loc) -> ArrayFuture {
  ArrayFuture future{.id = FutureId{next_future_++}, .length = 0};
  if (CheckArray(array, loc)) {
    array_futures_.emplace_back(future.id, array);
  }
  return future;
}

void Builder::BeginIf(
    ValueId lhs, CompareOp compare, ValueOrConst rhs, Location loc) {
  CheckValue(lhs, loc);
  CheckOperand(rhs, loc);
  scopes_.push_back(
      Scope{
          .node =
              Operation{
                  .data =
                      IfOp{
                          .lhs = lhs,
                          .compare = compare,
                          .rhs = rhs,
                          .then_body = {},
                          .else_body = {},
                      },
                  .host_line = HostLine::FromSourceLocation(loc),
              },
          .in_else = false,
      });
}

auto Builder::BeginElse(Location loc) -> Result<void> {
  if (scopes_.empty() || !std::holds_alternative<IfOp>(scopes_.back().node.data)) {
    return std::unexpected(
        Diagnostic::Compile(SpanOf(loc), "else without an open if block"));
  }
  if (scopes_.back().in_else) {
    return std::unexpected(
        Diagnostic::Compile(SpanOf(loc), "if block already has an else"));
  }
  scopes_.back().in_else = true;
  return {};
}

auto Builder::EndIf(Location loc) -> Result<void> {
  return CloseScope(false, loc);
}

auto Builder::BeginLoop(int32_t iterations, Location loc) -> ValueId {
  auto counter = NewValue();
  if (iterations < 0) {
    Fail(
        loc,
        fmt::format("loop count must not be negative, got {}", iterations));
  }
  scopes_.push_back(
      Scope{
          .node =
              Operation{
                  .data =
                      LoopOp{
                          .iterations = iterations,
                          .counter = counter,
                          .body = {},
                      },
                  .host_line = HostLine::FromSourceLocation(loc),
              },
          .in_else = false,
      });
  return counter;
}

auto Builder::EndLoop(Location loc) -> Result<void> {
  return CloseScope(true, loc);
}

auto Builder::CloseScope(bool want_loop, const Location& loc) -> Result<void> {
  const char* what = want_loop ? "loop" : "if";
  if (scopes_.empty()) {
    return std::unexpected(
        Diagnostic::Compile(
            SpanOf(loc), fmt::format("end of {} block with no open block", what)));
  }
  bool is_loop = std::holds_alternative<LoopOp>(scopes_.back().node.data);
  if (is_loop != want_loop) {
    return std::unexpected(
        Diagnostic::Compile(
            SpanOf(loc),
            fmt::format(
                "end of {} block while a {} block is open", what,
                is_loop ? "loop" : "if")));
  }
  auto node = std::move(scopes_.back().node);
  scopes_.pop_back();
  Body().push_back(std::move(node));
  return {};
}

void Builder::ResetFlush() {
  root_.clear();
  scopes_.clear();
  error_.reset();
  value_futures_.clear();
  array_futures_.clear();
  // Values and arrays of the finished flush become unusable.
  ++generation_;
}

auto Builder::PendingInput() const -> LoweringInput {
  LoweringInput input{
      .operations = &root_,
      .live_qubits = {},
      .value_futures = value_futures_,
      .array_futures = array_futures_,
  };
  for (const auto& info : qubits_at_flush_start_) {
    if (info.allocated) {
      input.live_qubits.insert(info.virtual_id);
    }
  }
  return input;
}

auto Builder::Flush() -> Result<CompiledSubroutine> {
  if (!scopes_.empty()) {
    auto diag =
        Diagnostic::Compile(
            HostSpan{.host_line = scopes_.back().node.host_line},
            fmt::format(
                "flush with {} block(s) still open", scopes_.size()));
    qubits_ = qubits_at_flush_start_;
    ResetFlush();
    return std::unexpected(std::move(diag));
  }
  if (error_) {
    auto diag = std::move(*error_);
    qubits_ = qubits_at_flush_start_;
    ResetFlush();
    return std::unexpected(std::move(diag));
  }

  auto input = PendingInput();
  spdlog::debug(
      "compiler: flushing {} operation(s) for app {}", root_.size(),
      options_.app_id);
  auto compiled = Compile(input, flavour_, options_.app_id);
  if (!compiled) {
    qubits_ = qubits_at_flush_start_;
  } else {
    qubits_at_flush_start_ = qubits_;
  }
  ResetFlush();
  return compiled;
}

}  // namespace netqasm::compiler
