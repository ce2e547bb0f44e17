#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace netqasm::lang {

// Register banks. The numeric value is the 2-bit bank field of the encoding.
enum class RegisterBank : uint8_t {
  kR = 0,  // General purpose
  kC = 1,  // Constants
  kQ = 2,  // Qubit addresses
  kM = 3,  // Measurement outcomes
};

inline constexpr uint32_t kNumRegisterBanks = 4;
inline constexpr uint32_t kRegistersPerBank = 16;

struct Register {
  RegisterBank bank = RegisterBank::kR;
  uint8_t index = 0;

  auto operator==(const Register&) const -> bool = default;
  auto operator<=>(const Register&) const = default;

  static constexpr auto R(uint8_t index) -> Register {
    return {.bank = RegisterBank::kR, .index = index};
  }
  static constexpr auto C(uint8_t index) -> Register {
    return {.bank = RegisterBank::kC, .index = index};
  }
  static constexpr auto Q(uint8_t index) -> Register {
    return {.bank = RegisterBank::kQ, .index = index};
  }
  static constexpr auto M(uint8_t index) -> Register {
    return {.bank = RegisterBank::kM, .index = index};
  }
};

struct Immediate {
  int32_t value = 0;

  auto operator==(const Immediate&) const -> bool = default;
};

struct Address {
  int32_t value = 0;

  auto operator==(const Address&) const -> bool = default;
};

struct ArrayEntry {
  Address address;
  Register index;

  auto operator==(const ArrayEntry&) const -> bool = default;
};

struct ArraySlice {
  Address address;
  Register start;
  Register stop;

  auto operator==(const ArraySlice&) const -> bool = default;
};

// Symbolic branch target. Only legal before a subroutine is finalized.
struct LabelRef {
  std::string name;

  auto operator==(const LabelRef&) const -> bool = default;
};

using Operand =
    std::variant<Register, Immediate, Address, ArrayEntry, ArraySlice, LabelRef>;

auto ToString(RegisterBank bank) -> std::string_view;
auto ToString(const Register& reg) -> std::string;
auto ToString(const Operand& operand) -> std::string;

// Parses "R3", "Q0", ... Returns nullopt when the text is not a register.
auto ParseRegister(std::string_view text) -> std::optional<Register>;

}  // namespace netqasm::lang
