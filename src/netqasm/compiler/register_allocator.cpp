#include "netqasm/compiler/register_allocator.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <tuple>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "absl/container/flat_hash_map.h"
#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/virtual_program.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::compiler {

namespace {

using lang::Opcode;

// Operand slot an instruction writes, if any.
auto DefinedSlot(Opcode opcode) -> std::optional<size_t> {
  switch (opcode) {
    case Opcode::kSet:
    case Opcode::kLoad:
    case Opcode::kLea:
    case Opcode::kAdd:
    case Opcode::kSub:
    case Opcode::kMul:
    case Opcode::kDiv:
    case Opcode::kRem:
    case Opcode::kAddm:
    case Opcode::kSubm:
      return 0;
    case Opcode::kMeas:
    case Opcode::kRecv:
      return 1;
    default:
      return std::nullopt;
  }
}

struct Occurrence {
  uint32_t start = 0;
  uint32_t end = 0;
  bool first_is_read = false;
};

auto BankIndex(lang::RegisterBank bank) -> size_t {
  return static_cast<size_t>(bank);
}

}  // namespace

auto ComputeLiveIntervals(const VProgram& program)
    -> std::vector<LiveInterval> {
  absl::flat_hash_map<VReg, Occurrence> occurrences;

  // Backward pass: `end` is fixed by the last occurrence, `start` keeps moving
  // back to the first.
  for (size_t n = program.instrs.size(); n > 0; --n) {
    auto index = static_cast<uint32_t>(n - 1);
    const auto& instr = program.instrs[index];
    auto defined_slot = DefinedSlot(instr.opcode);
    std::optional<VReg> defined;
    if (defined_slot && *defined_slot < instr.operands.size()) {
      if (const auto* reg = std::get_if<VReg>(&instr.operands[*defined_slot])) {
        defined = *reg;
      }
    }

    auto regs = CollectVRegs(instr);
    for (const auto& reg : regs) {
      bool written = defined && *defined == reg;
      // `add C C one` reads C as well as writing it.
      auto uses = std::ranges::count(regs, reg);
      bool read = uses > (written ? 1 : 0);
      auto [it, inserted] = occurrences.try_emplace(reg);
      if (inserted) {
        it->second.end = index;
      }
      it->second.start = index;
      it->second.first_is_read = read;
    }
  }

  std::vector<LiveInterval> intervals;
  intervals.reserve(occurrences.size());
  absl::flat_hash_map<VReg, bool> carried;
  for (const auto& [reg, occ] : occurrences) {
    intervals.push_back(
        LiveInterval{.reg = reg, .start = occ.start, .end = occ.end});
    carried[reg] = occ.first_is_read;
  }

  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto& loop : program.loops) {
      for (auto& interval : intervals) {
        bool overlaps = interval.start <= loop.end && loop.begin <= interval.end;
        if (!overlaps) {
          continue;
        }
        bool crosses = interval.start < loop.begin || interval.end > loop.end;
        if (!crosses && !carried[interval.reg]) {
          continue;
        }
        auto start = std::min(interval.start, loop.begin);
        auto end = std::max(interval.end, loop.end);
        if (start != interval.start || end != interval.end) {
          interval.start = start;
          interval.end = end;
          changed = true;
        }
      }
    }
  }

  std::ranges::sort(intervals, [](const LiveInterval& a, const LiveInterval& b) {
    return std::tie(a.start, a.reg.id) < std::tie(b.start, b.reg.id);
  });
  return intervals;
}

auto AllocateRegisters(
    const std::vector<LiveInterval>& intervals, uint32_t register_count)
    -> Result<RegisterAssignment> {
  RegisterAssignment assignment;

  struct Active {
    uint32_t end;
    uint8_t index;
  };
  std::array<std::vector<Active>, lang::kNumRegisterBanks> active;
  std::array<std::vector<bool>, lang::kNumRegisterBanks> in_use;
  for (auto& bank : in_use) {
    bank.assign(register_count, false);
  }

  for (const auto& interval : intervals) {
    auto bank = BankIndex(interval.reg.bank);
    auto& bank_active = active[bank];
    auto& bank_in_use = in_use[bank];

    // Registers become free only once their interval has strictly ended.
    std::erase_if(bank_active, [&](const Active& a) {
      if (a.end < interval.start) {
        bank_in_use[a.index] = false;
        return true;
      }
      return false;
    });

    auto free = std::ranges::find(bank_in_use, false);
    if (free == bank_in_use.end()) {
      return std::unexpected(
          Diagnostic::Layout(
              UnknownSpan{},
              fmt::format(
                  "out of {} registers: more than {} values live at "
                  "instruction {}",
                  lang::ToString(interval.reg.bank), register_count,
                  interval.start)));
    }
    auto index = static_cast<uint8_t>(free - bank_in_use.begin());
    *free = true;
    bank_active.push_back(Active{.end = interval.end, .index = index});
    assignment.emplace(
        interval.reg,
        lang::Register{.bank = interval.reg.bank, .index = index});
  }

  spdlog::debug(
      "compiler: assigned {} virtual registers", assignment.size());
  return assignment;
}

auto VerifyAssignment(
    const std::vector<LiveInterval>& intervals,
    const RegisterAssignment& assignment) -> Result<void> {
  for (size_t i = 0; i < intervals.size(); ++i) {
    const auto& a = intervals[i];
    auto ra = assignment.find(a.reg);
    if (ra == assignment.end()) {
      return std::unexpected(
          Diagnostic::Layout(
              UnknownSpan{},
              fmt::format("virtual register {} was not assigned", a.reg.id)));
    }
    for (size_t j = i + 1; j < intervals.size(); ++j) {
      const auto& b = intervals[j];
      if (!a.Overlaps(b)) {
        continue;
      }
      auto rb = assignment.find(b.reg);
      if (rb != assignment.end() && rb->second == ra->second) {
        return std::unexpected(
            Diagnostic::Layout(
                UnknownSpan{},
                fmt::format(
                    "register {} is shared by overlapping values live over "
                    "[{}, {}] and [{}, {}]",
                    lang::ToString(ra->second), a.start, a.end, b.start,
                    b.end)));
      }
    }
  }
  return {};
}

}  // namespace netqasm::compiler
