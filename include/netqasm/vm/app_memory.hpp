#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::vm {

using ArrayValues = std::vector<std::optional<int32_t>>;

using RegisterFile =
    std::array<std::array<int32_t, lang::kRegistersPerBank>,
               lang::kNumRegisterBanks>;

// Classical and qubit state of one application. Persists across the
// subroutines the application submits.
class AppMemory {
 public:
  static constexpr int32_t kMaxArrayLength = 1 << 16;
  static constexpr size_t kMaxTotalEntries = size_t{1} << 20;

  [[nodiscard]] auto GetRegister(const lang::Register& reg) const -> int32_t {
    return registers_[static_cast<size_t>(reg.bank)][reg.index];
  }

  void SetRegister(const lang::Register& reg, int32_t value) {
    registers_[static_cast<size_t>(reg.bank)][reg.index] = value;
  }

  [[nodiscard]] auto Registers() const -> const RegisterFile& {
    return registers_;
  }

  // Creates or replaces the array at `address` with `length` undefined
  // entries. Lengths above kMaxArrayLength, or arrays that would take the
  // application past kMaxTotalEntries, are execution errors and leave memory
  // unchanged.
  auto InitArray(int32_t address, int32_t length) -> Result<void>;

  [[nodiscard]] auto GetArray(int32_t address) const
      -> Result<const ArrayValues*>;

  [[nodiscard]] auto GetEntry(int32_t address, int32_t index) const
      -> Result<std::optional<int32_t>>;

  auto SetEntry(int32_t address, int32_t index, std::optional<int32_t> value)
      -> Result<void>;

  // Entries [start, stop) of the array at `address`.
  [[nodiscard]] auto GetSlice(int32_t address, int32_t start, int32_t stop) const
      -> Result<ArrayValues>;

  [[nodiscard]] auto Arrays() const -> const std::map<int32_t, ArrayValues>& {
    return arrays_;
  }

  [[nodiscard]] auto HasQubit(int32_t virtual_id) const -> bool {
    return qubits_.contains(virtual_id);
  }

  // Physical qubit bound to a virtual id; AddressError when unbound.
  [[nodiscard]] auto PhysicalQubit(int32_t virtual_id) const -> Result<int32_t>;

  void BindQubit(int32_t virtual_id, int32_t physical_id) {
    qubits_[virtual_id] = physical_id;
  }

  void UnbindQubit(int32_t virtual_id) {
    qubits_.erase(virtual_id);
  }

  [[nodiscard]] auto Qubits() const -> const std::map<int32_t, int32_t>& {
    return qubits_;
  }

 private:
  RegisterFile registers_{};
  std::map<int32_t, ArrayValues> arrays_;
  std::map<int32_t, int32_t> qubits_;
};

}  // namespace netqasm::vm
