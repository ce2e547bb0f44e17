#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/vm/app_memory.hpp"
#include "netqasm/vm/executor.hpp"

namespace netqasm::compiler {

// Value published from a register at the end of a subroutine.
struct Future {
  FutureId id = kInvalidFutureId;

  auto operator==(const Future&) const -> bool = default;
};

// Array published at the end of a subroutine.
struct ArrayFuture {
  FutureId id = kInvalidFutureId;
  int32_t length = 0;

  auto operator==(const ArrayFuture&) const -> bool = default;
};

// Where a pending future will be read from once its subroutine returns.
struct RegisterSlot {
  lang::Register reg;
};

struct ArraySlot {
  int32_t address = 0;
};

using FutureSlot = std::variant<RegisterSlot, ArraySlot>;

struct Pending {
  FutureSlot slot;
};

struct Resolved {
  std::variant<int32_t, vm::ArrayValues> value;
};

using FutureState = std::variant<Pending, Resolved>;

// Host-side table of futures. Each future moves from Pending to Resolved
// exactly once.
class ResultStore {
 public:
  void AddPending(FutureId id, FutureSlot slot);

  // Resolves `ids` from the values their subroutine returned. Futures of a
  // subroutine that failed are never resolved and stay pending.
  auto Resolve(
      const std::vector<FutureId>& ids, const vm::ReturnedValues& returned)
      -> Result<void>;

  [[nodiscard]] auto Read(Future future) const -> Result<int32_t>;
  [[nodiscard]] auto ReadArray(ArrayFuture future) const
      -> Result<vm::ArrayValues>;

  // Single entry of an array future. Undefined entries are execution errors.
  [[nodiscard]] auto ReadEntry(ArrayFuture future, int32_t index) const
      -> Result<int32_t>;

  [[nodiscard]] auto IsResolved(FutureId id) const -> bool;

 private:
  [[nodiscard]] auto Find(FutureId id) const -> Result<const Resolved*>;

  absl::flat_hash_map<FutureId, FutureState> states_;
};

}  // namespace netqasm::compiler
