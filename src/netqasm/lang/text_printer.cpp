#include "netqasm/lang/text_printer.hpp"

#include <string>

#include <fmt/core.h>

#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::lang {

auto PrintText(const Subroutine& subroutine) -> std::string {
  std::string out = fmt::format(
      "# NETQASM {}.{}\n# APPID {}\n", subroutine.Version().major,
      subroutine.Version().minor, subroutine.AppId());
  for (const auto& instr : subroutine.Instructions()) {
    out += ToString(instr);
    out += '\n';
  }
  return out;
}

}  // namespace netqasm::lang
