#include "netqasm/compiler/compiler.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/compiler/lowering.hpp"
#include "netqasm/compiler/register_allocator.hpp"
#include "netqasm/compiler/virtual_program.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::compiler {

namespace {

auto Physical(const RegisterAssignment& assignment, const VReg& reg)
    -> lang::Register {
  auto it = assignment.find(reg);
  if (it == assignment.end()) {
    common::ThrowInternalError(
        "Compile", fmt::format("virtual register {} has no assignment", reg.id));
  }
  return it->second;
}

auto ToOperand(const RegisterAssignment& assignment, const VOperand& operand)
    -> lang::Operand {
  return std::visit(
      Overloaded{
          [&](const VReg& r) -> lang::Operand {
            return Physical(assignment, r);
          },
          [](const lang::Immediate& i) -> lang::Operand { return i; },
          [](const lang::Address& a) -> lang::Operand { return a; },
          [&](const VEntry& e) -> lang::Operand {
            return lang::ArrayEntry{
                .address = e.address,
                .index = Physical(assignment, e.index),
            };
          },
          [&](const VSlice& s) -> lang::Operand {
            return lang::ArraySlice{
                .address = s.address,
                .start = Physical(assignment, s.start),
                .stop = Physical(assignment, s.stop),
            };
          },
          [](const lang::LabelRef& l) -> lang::Operand { return l; },
      },
      operand);
}

}  // namespace

auto Compile(
    const LoweringInput& input, const flavour::Flavour& flavour,
    uint16_t app_id) -> Result<CompiledSubroutine> {
  auto lowered = Lower(input, flavour);
  if (!lowered) {
    return std::unexpected(std::move(lowered).error());
  }
  const VProgram& program = lowered->program;

  auto intervals = ComputeLiveIntervals(program);
  auto assignment = AllocateRegisters(intervals, flavour.register_count);
  if (!assignment) {
    return std::unexpected(std::move(assignment).error());
  }
  auto verified = VerifyAssignment(intervals, *assignment);
  if (!verified) {
    return std::unexpected(std::move(verified).error());
  }

  lang::SubroutineBuilder builder(app_id);
  size_t next_label = 0;
  auto place_labels_up_to = [&](uint32_t index) {
    while (next_label < program.labels.size() &&
           program.labels[next_label].index <= index) {
      builder.PlaceLabel(program.labels[next_label].name);
      ++next_label;
    }
  };

  for (size_t i = 0; i < program.instrs.size(); ++i) {
    place_labels_up_to(static_cast<uint32_t>(i));
    const auto& vinstr = program.instrs[i];
    std::vector<lang::Operand> operands;
    operands.reserve(vinstr.operands.size());
    for (const auto& operand : vinstr.operands) {
      operands.push_back(ToOperand(*assignment, operand));
    }
    builder.Append(
        lang::Instruction::Make(vinstr.opcode, std::move(operands)),
        vinstr.host_line);
  }
  place_labels_up_to(static_cast<uint32_t>(program.instrs.size()));

  auto subroutine = std::move(builder).Finalize(flavour);
  if (!subroutine) {
    return std::unexpected(std::move(subroutine).error());
  }

  CompiledSubroutine out{.subroutine = std::move(*subroutine)};
  for (const auto& [future, reg] : lowered->register_futures) {
    out.register_futures.emplace_back(future, Physical(*assignment, reg));
  }
  out.array_futures = lowered->array_futures;

  spdlog::debug(
      "compiler: app {} subroutine has {} instructions",
      out.subroutine.AppId(), out.subroutine.Size());
  return out;
}

}  // namespace netqasm::compiler
