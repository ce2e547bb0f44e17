#include "netqasm/lang/subroutine.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::lang {

namespace {

auto CheckRegister(
    const Register& reg, const flavour::Flavour& flavour, InstrSpan span)
    -> Result<void> {
  if (reg.index >= flavour.register_count) {
    return std::unexpected(
        Diagnostic::Layout(
            std::move(span), fmt::format(
                                 "register {} exceeds the {} registers per bank",
                                 ToString(reg), flavour.register_count)));
  }
  return {};
}

auto CheckAddress(
    const Address& addr, const flavour::Flavour& flavour, InstrSpan span)
    -> Result<void> {
  if (addr.value < 0 || addr.value >= flavour.array_address_limit) {
    return std::unexpected(
        Diagnostic::Layout(
            std::move(span),
            fmt::format(
                "array address @{} outside [0, {})", addr.value,
                flavour.array_address_limit)));
  }
  return {};
}

auto CheckOperands(
    const Instruction& instr, const flavour::Flavour& flavour, InstrSpan span)
    -> Result<void> {
  for (const auto& reg : CollectRegisters(instr)) {
    auto r = CheckRegister(reg, flavour, span);
    if (!r) {
      return r;
    }
  }
  for (const auto& operand : instr.operands) {
    std::optional<Address> addr = std::visit(
        Overloaded{
            [](const Address& a) -> std::optional<Address> { return a; },
            [](const ArrayEntry& e) -> std::optional<Address> {
              return e.address;
            },
            [](const ArraySlice& s) -> std::optional<Address> {
              return s.address;
            },
            [](const auto&) -> std::optional<Address> { return std::nullopt; },
        },
        operand);
    if (addr) {
      auto r = CheckAddress(*addr, flavour, span);
      if (!r) {
        return r;
      }
    }
  }
  return {};
}

auto CheckInstruction(
    const Instruction& instr, const flavour::Flavour& flavour, InstrSpan span)
    -> Result<void> {
  if (!flavour.Supports(instr.opcode)) {
    return std::unexpected(
        Diagnostic::Unsupported(
            span, fmt::format(
                      "'{}' is not available in the {} flavour",
                      ToString(instr.opcode), flavour.name)));
  }
  auto typed = TypeCheck(instr, false);
  if (!typed) {
    return std::unexpected(std::move(typed).error().AtInstruction(span));
  }
  return CheckOperands(instr, flavour, std::move(span));
}

}  // namespace

auto SubroutineBuilder::Append(
    Instruction instr, std::optional<HostLine> host_line) -> uint32_t {
  auto index = static_cast<uint32_t>(instructions_.size());
  instructions_.push_back(std::move(instr));
  host_lines_.push_back(std::move(host_line));
  return index;
}

void SubroutineBuilder::PlaceLabel(
    std::string name, std::optional<HostLine> host_line) {
  labels_.push_back(
      PlacedLabel{
          .name = std::move(name),
          .index = static_cast<uint32_t>(instructions_.size()),
          .host_line = std::move(host_line),
      });
}

auto SubroutineBuilder::Finalize(const flavour::Flavour& flavour) &&
    -> Result<Subroutine> {
  DebugMap debug_map;
  for (size_t i = 0; i < host_lines_.size(); ++i) {
    if (host_lines_[i]) {
      debug_map.Record(static_cast<uint32_t>(i), *host_lines_[i]);
    }
  }
  auto span_of = [&](size_t i) {
    return InstrSpan{
        .index = static_cast<uint32_t>(i),
        .host_line = debug_map.Resolve(static_cast<uint32_t>(i))};
  };

  std::map<std::string, uint32_t> label_index;
  for (const auto& label : labels_) {
    auto [it, inserted] = label_index.emplace(label.name, label.index);
    if (!inserted) {
      return std::unexpected(
          Diagnostic::Layout(
              InstrSpan{.index = label.index, .host_line = label.host_line},
              fmt::format("duplicate label '{}'", label.name))
              .WithNote(
                  fmt::format(
                      "first placed before instruction {}", it->second)));
    }
  }

  for (size_t i = 0; i < instructions_.size(); ++i) {
    auto& instr = instructions_[i];
    auto typed = TypeCheck(instr, true);
    if (!typed) {
      return std::unexpected(std::move(typed).error().AtInstruction(span_of(i)));
    }
    auto target = BranchTargetIndex(instr.opcode);
    if (!target) {
      continue;
    }
    auto* label = std::get_if<LabelRef>(&instr.operands[*target]);
    if (label == nullptr) {
      continue;
    }
    auto it = label_index.find(label->name);
    if (it == label_index.end()) {
      return std::unexpected(
          Diagnostic::Layout(
              span_of(i), fmt::format("undefined label '{}'", label->name)));
    }
    instr.operands[*target] = Immediate{static_cast<int32_t>(it->second)};
  }

  Subroutine subroutine(
      version_, app_id_, std::move(instructions_), std::move(debug_map));
  auto valid = ValidateSubroutine(subroutine, flavour);
  if (!valid) {
    return std::unexpected(std::move(valid).error());
  }
  return subroutine;
}

auto ValidateSubroutine(
    const Subroutine& subroutine, const flavour::Flavour& flavour)
    -> Result<void> {
  auto size = static_cast<int64_t>(subroutine.Size());
  for (size_t i = 0; i < subroutine.Size(); ++i) {
    const auto& instr = subroutine[i];
    auto span = subroutine.SpanOf(static_cast<uint32_t>(i));
    auto checked = CheckInstruction(instr, flavour, span);
    if (!checked) {
      return checked;
    }
    auto target = BranchTargetIndex(instr.opcode);
    if (target) {
      int32_t dest = instr.Imm(*target);
      if (dest < 0 || dest > size) {
        return std::unexpected(
            Diagnostic::Layout(
                span, fmt::format(
                          "branch target {} outside [0, {}]", dest, size)));
      }
    }
  }
  return {};
}

}  // namespace netqasm::lang
