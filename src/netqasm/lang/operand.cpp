#include "netqasm/lang/operand.hpp"

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <fmt/core.h>

#include "netqasm/common/overloaded.hpp"

namespace netqasm::lang {

auto ToString(RegisterBank bank) -> std::string_view {
  switch (bank) {
    case RegisterBank::kR:
      return "R";
    case RegisterBank::kC:
      return "C";
    case RegisterBank::kQ:
      return "Q";
    case RegisterBank::kM:
      return "M";
  }
  return "?";
}

auto ToString(const Register& reg) -> std::string {
  return fmt::format("{}{}", ToString(reg.bank), reg.index);
}

auto ToString(const Operand& operand) -> std::string {
  return std::visit(
      Overloaded{
          [](const Register& r) { return ToString(r); },
          [](const Immediate& i) { return std::to_string(i.value); },
          [](const Address& a) { return fmt::format("@{}", a.value); },
          [](const ArrayEntry& e) {
            return fmt::format("@{}[{}]", e.address.value, ToString(e.index));
          },
          [](const ArraySlice& s) {
            return fmt::format(
                "@{}[{}:{}]", s.address.value, ToString(s.start),
                ToString(s.stop));
          },
          [](const LabelRef& l) { return l.name; },
      },
      operand);
}

auto ParseRegister(std::string_view text) -> std::optional<Register> {
  if (text.size() < 2) {
    return std::nullopt;
  }
  RegisterBank bank{};
  switch (text[0]) {
    case 'R':
      bank = RegisterBank::kR;
      break;
    case 'C':
      bank = RegisterBank::kC;
      break;
    case 'Q':
      bank = RegisterBank::kQ;
      break;
    case 'M':
      bank = RegisterBank::kM;
      break;
    default:
      return std::nullopt;
  }
  std::string_view digits = text.substr(1);
  unsigned index = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() ||
      index > UINT8_MAX) {
    return std::nullopt;
  }
  return Register{.bank = bank, .index = static_cast<uint8_t>(index)};
}

}  // namespace netqasm::lang
