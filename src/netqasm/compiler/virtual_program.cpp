#include "netqasm/compiler/virtual_program.hpp"

#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/overloaded.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::compiler {

namespace {

auto VRegName(const VReg& reg) -> std::string {
  return fmt::format("%{}{}", lang::ToString(reg.bank), reg.id);
}

}  // namespace

auto CollectVRegs(const VInstr& instr) -> std::vector<VReg> {
  std::vector<VReg> regs;
  for (const auto& operand : instr.operands) {
    std::visit(
        Overloaded{
            [&](const VReg& r) { regs.push_back(r); },
            [&](const VEntry& e) { regs.push_back(e.index); },
            [&](const VSlice& s) {
              regs.push_back(s.start);
              regs.push_back(s.stop);
            },
            [](const auto&) {},
        },
        operand);
  }
  return regs;
}

auto ToString(const VInstr& instr) -> std::string {
  std::string out(lang::ToString(instr.opcode));
  for (const auto& operand : instr.operands) {
    out += ' ';
    out += std::visit(
        Overloaded{
            [](const VReg& r) { return VRegName(r); },
            [](const lang::Immediate& i) { return fmt::format("{}", i.value); },
            [](const lang::Address& a) { return fmt::format("@{}", a.value); },
            [](const VEntry& e) {
              return fmt::format("@{}[{}]", e.address.value, VRegName(e.index));
            },
            [](const VSlice& s) {
              return fmt::format(
                  "@{}[{}:{}]", s.address.value, VRegName(s.start),
                  VRegName(s.stop));
            },
            [](const lang::LabelRef& l) { return l.name; },
        },
        operand);
  }
  return out;
}

}  // namespace netqasm::compiler
