#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/diagnostic/diagnostic_sink.hpp"
#include "netqasm/common/host_line.hpp"
#include "netqasm/compiler/compiler.hpp"
#include "netqasm/compiler/future.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/compiler/lowering.hpp"
#include "netqasm/compiler/operation.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/vm/processor.hpp"

namespace netqasm::compiler {

struct BuilderOptions {
  uint16_t app_id = 0;
  // Radians an approximated angle may deviate from the requested one.
  double angle_tolerance = 1e-9;
};

struct EprRequest {
  int32_t remote_node = 0;
  int32_t socket = 0;
  vm::EprType type = vm::EprType::kCreateKeep;
  int32_t number = 1;
  int32_t min_fidelity = 0;
};

struct EprResult {
  // Local halves, one per pair, for pair types that keep a qubit.
  std::vector<QubitId> qubits;
  // Entanglement info, kEntInfoFields entries per pair.
  ArrayFuture info;
};

struct MeasureResult {
  ValueId value;
  Future future;
};

// Records application operations into an operation tree. Blocks are opened
// and closed explicitly; Flush() compiles everything recorded since the
// previous flush into one subroutine.
//
// Misuse that can only be judged in program order (a freed qubit, a value
// from an earlier flush) is remembered and reported by the next Flush().
class Builder {
 public:
  using Location = std::source_location;

  explicit Builder(
      const flavour::Flavour& flavour, BuilderOptions options = {});

  auto AllocQubit(Location loc = Location::current()) -> QubitId;
  // Allocates a previously freed handle again.
  void Reallocate(QubitId qubit, Location loc = Location::current());
  void FreeQubit(QubitId qubit, Location loc = Location::current());

  void Apply(lang::Gate gate, QubitId qubit, Location loc = Location::current());
  void Apply(
      lang::Gate gate, QubitId control, QubitId target,
      Location loc = Location::current());
  void Rotate(
      lang::Gate gate, QubitId qubit, lang::Angle angle,
      Location loc = Location::current());
  void RotateRadians(
      lang::Gate gate, QubitId qubit, double radians,
      Location loc = Location::current());
  void ControlledRotate(
      lang::Gate gate, QubitId control, QubitId target, lang::Angle angle,
      Location loc = Location::current());
  void ControlledRotateRadians(
      lang::Gate gate, QubitId control, QubitId target, double radians,
      Location loc = Location::current());

  auto Measure(QubitId qubit, Location loc = Location::current())
      -> MeasureResult;

  auto Set(int32_t value, Location loc = Location::current()) -> ValueId;
  auto Add(
      ValueOrConst lhs, ValueOrConst rhs, Location loc = Location::current())
      -> ValueId;
  auto Sub(
      ValueOrConst lhs, ValueOrConst rhs, Location loc = Location::current())
      -> ValueId;
  auto Mul(
      ValueOrConst lhs, ValueOrConst rhs, Location loc = Location::current())
      -> ValueId;

  auto NewArray(int32_t length, Location loc = Location::current()) -> ArrayId;
  void Store(
      ArrayId array, ValueOrConst index, ValueOrConst value,
      Location loc = Location::current());
  auto Load(
      ArrayId array, ValueOrConst index, Location loc = Location::current())
      -> ValueId;

  auto CreateEpr(const EprRequest& request, Location loc = Location::current())
      -> EprResult;
  auto RecvEpr(const EprRequest& request, Location loc = Location::current())
      -> EprResult;

  void Send(
      int32_t peer, ValueOrConst value, Location loc = Location::current());
  auto Recv(int32_t peer, Location loc = Location::current()) -> ValueId;

  void Breakpoint(
      vm::BreakpointAction action, vm::BreakpointRole role,
      Location loc = Location::current());

  // Publishes a value or a whole array when the subroutine ends.
  auto ReturnValue(ValueId value, Location loc = Location::current())
      -> Future;
  auto ReturnArray(ArrayId array, Location loc = Location::current())
      -> ArrayFuture;

  void BeginIf(
      ValueId lhs, CompareOp compare, ValueOrConst rhs,
      Location loc = Location::current());
  auto BeginElse(Location loc = Location::current()) -> Result<void>;
  auto EndIf(Location loc = Location::current()) -> Result<void>;

  // Returns the loop counter, which counts 0..iterations-1.
  auto BeginLoop(int32_t iterations, Location loc = Location::current())
      -> ValueId;
  auto EndLoop(Location loc = Location::current()) -> Result<void>;

  // Compiles the operations recorded since the previous flush. On failure
  // those operations are discarded and qubit bookkeeping is rolled back.
  auto Flush() -> Result<CompiledSubroutine>;

  // What the next Flush() would hand to the compiler. The operations are
  // borrowed and stay valid until the builder records or flushes again.
  [[nodiscard]] auto PendingInput() const -> LoweringInput;

  [[nodiscard]] auto Warnings() const -> const DiagnosticSink& {
    return warnings_;
  }
  [[nodiscard]] auto PendingOperations() const -> size_t {
    return root_.size();
  }
  [[nodiscard]] auto GetFlavour() const -> const flavour::Flavour& {
    return flavour_;
  }

 private:
  struct QubitInfo {
    int32_t virtual_id = 0;
    bool allocated = false;
  };

  struct Scope {
    Operation node;
    bool in_else = false;
  };

  auto Body() -> std::vector<Operation>&;
  void Record(OperationData data, const Location& loc);
  void Fail(const Location& loc, std::string msg);

  auto LowestFreeVirtualId() const -> int32_t;
  auto NewQubit() -> QubitId;
  auto Ref(QubitId qubit, const Location& loc) -> std::optional<QubitRef>;

  auto NewValue() -> ValueId;
  auto CheckValue(ValueId value, const Location& loc) -> bool;
  auto CheckOperand(const ValueOrConst& operand, const Location& loc) -> bool;
  auto CheckArray(ArrayId array, const Location& loc) -> bool;

  void RecordGate(
      lang::Gate gate, QubitId first, std::optional<QubitId> second,
      std::optional<lang::Angle> angle, const Location& loc);
  auto Approximate(double radians, const Location& loc) -> lang::Angle;
  auto Binary(
      BinaryKind kind, ValueOrConst lhs, ValueOrConst rhs, const Location& loc)
      -> ValueId;
  auto Epr(vm::EprRole role, const EprRequest& request, const Location& loc)
      -> EprResult;
  auto CloseScope(bool want_loop, const Location& loc) -> Result<void>;
  void ResetFlush();

  const flavour::Flavour& flavour_;
  BuilderOptions options_;
  DiagnosticSink warnings_;

  std::vector<Operation> root_;
  std::vector<Scope> scopes_;
  std::optional<Diagnostic> error_;

  std::vector<QubitInfo> qubits_;
  std::vector<QubitInfo> qubits_at_flush_start_;

  // Flush generation each value and array was created in.
  uint32_t generation_ = 0;
  std::vector<uint32_t> value_generation_;
  std::vector<uint32_t> array_generation_;

  uint32_t next_future_ = 0;
  std::vector<std::pair<FutureId, ValueId>> value_futures_;
  std::vector<std::pair<FutureId, ArrayId>> array_futures_;
};

}  // namespace netqasm::compiler
