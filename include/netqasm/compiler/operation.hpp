#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "netqasm/common/host_line.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::compiler {

// Right-hand side of a classical operation: a value of this flush or a
// constant.
using ValueOrConst = std::variant<ValueId, int32_t>;

// A qubit as seen by one operation: the handle plus the virtual id it was
// bound to when the operation was recorded.
struct QubitRef {
  QubitId id = kInvalidQubitId;
  int32_t virtual_id = 0;

  auto operator==(const QubitRef&) const -> bool = default;
};

enum class CompareOp : uint8_t {
  kEq,
  kNe,
  kLt,
  kGe,
};

enum class BinaryKind : uint8_t {
  kAdd,
  kSub,
  kMul,
};

struct Operation;

struct AllocQubitOp {
  QubitRef qubit;
};

struct FreeQubitOp {
  QubitRef qubit;
};

struct GateOp {
  lang::Gate gate;
  QubitRef first;
  std::optional<QubitRef> second;  // Two-qubit gates
  std::optional<lang::Angle> angle;
};

struct MeasureOp {
  QubitRef qubit;
  ValueId result;
};

struct SetValueOp {
  ValueId result;
  int32_t value = 0;
};

struct BinaryOp {
  BinaryKind kind;
  ValueId result;
  ValueOrConst lhs;
  ValueOrConst rhs;
};

struct CreateArrayOp {
  ArrayId array;
  int32_t length = 0;
};

struct StoreOp {
  ArrayId array;
  ValueOrConst index;
  ValueOrConst value;
};

struct LoadOp {
  ValueId result;
  ArrayId array;
  ValueOrConst index;
};

// create_epr or recv_epr, depending on `role`. Keep-type pairs deliver into
// `qubits`, one per pair; `results` receives the entanglement info.
struct EprOp {
  vm::EprRole role;
  int32_t remote_node = 0;
  int32_t socket = 0;
  vm::EprType type = vm::EprType::kCreateKeep;
  int32_t number = 1;
  int32_t min_fidelity = 0;
  std::vector<QubitRef> qubits;
  ArrayId results;
};

struct SendOp {
  int32_t peer = 0;
  ValueOrConst value;
};

struct RecvOp {
  int32_t peer = 0;
  ValueId result;
};

struct BreakpointOp {
  vm::BreakpointAction action;
  vm::BreakpointRole role;
};

struct IfOp {
  ValueId lhs;
  CompareOp compare;
  ValueOrConst rhs;
  std::vector<Operation> then_body;
  std::vector<Operation> else_body;
};

struct LoopOp {
  int32_t iterations = 0;
  ValueId counter;
  std::vector<Operation> body;
};

using OperationData = std::variant<
    AllocQubitOp, FreeQubitOp, GateOp, MeasureOp, SetValueOp, BinaryOp,
    CreateArrayOp, StoreOp, LoadOp, EprOp, SendOp, RecvOp, BreakpointOp, IfOp,
    LoopOp>;

// One node of the recorded operation tree.
struct Operation {
  OperationData data;
  HostLine host_line;
};

}  // namespace netqasm::compiler
