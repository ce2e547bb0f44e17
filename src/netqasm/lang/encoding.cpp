#include "netqasm/lang/encoding.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::lang {

namespace {

void PutInt32(std::vector<uint8_t>& out, int32_t value) {
  auto bits = static_cast<uint32_t>(value);
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
  }
}

auto GetInt32(std::span<const uint8_t> bytes, size_t pos) -> int32_t {
  uint32_t bits = 0;
  for (size_t i = 0; i < 4; ++i) {
    bits |= static_cast<uint32_t>(bytes[pos + i]) << (8 * i);
  }
  return static_cast<int32_t>(bits);
}

auto SlotWidth(SlotKind kind) -> size_t {
  switch (kind) {
    case SlotKind::kRegister:
    case SlotKind::kUint8:
      return 1;
    case SlotKind::kInt32:
    case SlotKind::kAddress:
      return 4;
    case SlotKind::kEntry:
      return 5;
    case SlotKind::kSlice:
      return 6;
  }
  return 0;
}

// Rewrites rotation angles into the flavour's canonical form.
auto Canonicalize(const Instruction& instr, const flavour::Flavour& flavour)
    -> Instruction {
  auto angle = GetAngle(instr);
  if (!angle) {
    return instr;
  }
  Angle canonical = flavour.CanonicalAngle(*angle);
  Instruction out = instr;
  size_t num_slot = out.operands.size() - 2;
  out.operands[num_slot] = Immediate{canonical.num};
  out.operands[num_slot + 1] = Immediate{canonical.denom_exp};
  return out;
}

auto Truncated(size_t needed, size_t available) -> Diagnostic {
  return Diagnostic::Encoding(
      UnknownSpan{}, fmt::format(
                         "InvalidEncoding: command needs {} operand bytes, "
                         "only {} available",
                         needed, available));
}

}  // namespace

auto EncodeRegister(const Register& reg) -> uint8_t {
  return static_cast<uint8_t>(
      static_cast<uint8_t>(reg.bank) | static_cast<uint8_t>(reg.index << 2));
}

auto DecodeRegister(uint8_t byte) -> Result<Register> {
  if ((byte & 0xC0) != 0) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{},
            fmt::format(
                "InvalidEncoding: register byte {:#04x} has padding bits set",
                byte)));
  }
  return Register{
      .bank = static_cast<RegisterBank>(byte & 0x3),
      .index = static_cast<uint8_t>(byte >> 2)};
}

auto EncodeInstruction(
    const Instruction& instr, const flavour::Flavour& flavour,
    std::vector<uint8_t>& out) -> Result<void> {
  auto wire_id = flavour.WireId(instr.opcode);
  if (!wire_id) {
    return std::unexpected(
        Diagnostic::Unsupported(
            UnknownSpan{}, fmt::format(
                               "'{}' has no encoding in the {} flavour",
                               ToString(instr.opcode), flavour.name)));
  }
  auto typed = TypeCheck(instr, false);
  if (!typed) {
    return typed;
  }

  Instruction canonical = Canonicalize(instr, flavour);
  size_t start = out.size();
  out.push_back(*wire_id);
  auto slots = GetShapeSlots(GetOpcodeInfo(instr.opcode).shape);
  for (size_t i = 0; i < canonical.operands.size(); ++i) {
    std::visit(
        Overloaded{
            [&](const Register& r) {
              if (r.index >= kRegistersPerBank) {
                common::ThrowInternalError(
                    "EncodeInstruction", "register index out of range");
              }
              out.push_back(EncodeRegister(r));
            },
            [&](const Immediate& imm) {
              // Angle and breakpoint immediates are single bytes, range
              // checked by TypeCheck.
              if (slots[i] == SlotKind::kUint8) {
                out.push_back(static_cast<uint8_t>(imm.value));
              } else {
                PutInt32(out, imm.value);
              }
            },
            [&](const Address& a) { PutInt32(out, a.value); },
            [&](const ArrayEntry& e) {
              PutInt32(out, e.address.value);
              out.push_back(EncodeRegister(e.index));
            },
            [&](const ArraySlice& s) {
              PutInt32(out, s.address.value);
              out.push_back(EncodeRegister(s.start));
              out.push_back(EncodeRegister(s.stop));
            },
            [&](const LabelRef&) {
              common::ThrowInternalError(
                  "EncodeInstruction", "unresolved label after TypeCheck");
            },
        },
        canonical.operands[i]);
  }
  if (out.size() - start > kCommandSize) {
    common::ThrowInternalError(
        "EncodeInstruction",
        fmt::format("'{}' exceeds the command size", ToString(instr.opcode)));
  }
  out.resize(start + kCommandSize, 0);
  return {};
}

auto DecodeInstruction(
    std::span<const uint8_t> command, const flavour::Flavour& flavour)
    -> Result<Instruction> {
  if (command.size() != kCommandSize) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{}, fmt::format(
                               "InvalidEncoding: command must be {} bytes, "
                               "got {}",
                               kCommandSize, command.size())));
  }
  auto opcode = flavour.OpcodeFromWire(command[0]);
  if (!opcode) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{},
            fmt::format(
                "InvalidEncoding: unknown opcode id {} for the {} flavour",
                command[0], flavour.name)));
  }

  Instruction instr{.opcode = *opcode, .operands = {}};
  size_t pos = 1;
  for (SlotKind slot : GetShapeSlots(GetOpcodeInfo(*opcode).shape)) {
    size_t width = SlotWidth(slot);
    if (pos + width > kCommandSize) {
      return std::unexpected(Truncated(width, kCommandSize - pos));
    }
    switch (slot) {
      case SlotKind::kRegister: {
        auto reg = DecodeRegister(command[pos]);
        if (!reg) {
          return std::unexpected(std::move(reg).error());
        }
        instr.operands.emplace_back(*reg);
        break;
      }
      case SlotKind::kUint8:
        instr.operands.emplace_back(Immediate{command[pos]});
        break;
      case SlotKind::kInt32:
        instr.operands.emplace_back(Immediate{GetInt32(command, pos)});
        break;
      case SlotKind::kAddress:
        instr.operands.emplace_back(Address{GetInt32(command, pos)});
        break;
      case SlotKind::kEntry: {
        auto index = DecodeRegister(command[pos + 4]);
        if (!index) {
          return std::unexpected(std::move(index).error());
        }
        instr.operands.emplace_back(
            ArrayEntry{.address = {GetInt32(command, pos)}, .index = *index});
        break;
      }
      case SlotKind::kSlice: {
        auto start = DecodeRegister(command[pos + 4]);
        if (!start) {
          return std::unexpected(std::move(start).error());
        }
        auto stop = DecodeRegister(command[pos + 5]);
        if (!stop) {
          return std::unexpected(std::move(stop).error());
        }
        instr.operands.emplace_back(
            ArraySlice{
                .address = {GetInt32(command, pos)},
                .start = *start,
                .stop = *stop});
        break;
      }
    }
    pos += width;
  }

  for (; pos < kCommandSize; ++pos) {
    if (command[pos] != 0) {
      return std::unexpected(
          Diagnostic::Encoding(
              UnknownSpan{},
              fmt::format(
                  "InvalidEncoding: non-zero padding byte {} in '{}'", pos,
                  ToString(*opcode))));
    }
  }
  return instr;
}

auto EncodeSubroutine(
    const Subroutine& subroutine, const flavour::Flavour& flavour)
    -> Result<std::vector<uint8_t>> {
  std::vector<uint8_t> out;
  out.reserve(kMetadataSize + (kCommandSize * subroutine.Size()));
  out.push_back(subroutine.Version().major);
  out.push_back(subroutine.Version().minor);
  out.push_back(static_cast<uint8_t>(subroutine.AppId() & 0xFF));
  out.push_back(static_cast<uint8_t>(subroutine.AppId() >> 8));

  for (size_t i = 0; i < subroutine.Size(); ++i) {
    auto r = EncodeInstruction(subroutine[i], flavour, out);
    if (!r) {
      return std::unexpected(
          std::move(r).error().AtInstruction(
              subroutine.SpanOf(static_cast<uint32_t>(i))));
    }
  }
  return out;
}

auto DecodeSubroutine(
    std::span<const uint8_t> bytes, const flavour::Flavour& flavour)
    -> Result<Subroutine> {
  if (bytes.size() < kMetadataSize ||
      (bytes.size() - kMetadataSize) % kCommandSize != 0) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{},
            fmt::format(
                "InvalidEncoding: length {} is not {} + {}k", bytes.size(),
                kMetadataSize, kCommandSize)));
  }

  ProtocolVersion version{.major = bytes[0], .minor = bytes[1]};
  if (version != kCurrentVersion) {
    return std::unexpected(
        Diagnostic::Encoding(
            UnknownSpan{},
            fmt::format(
                "InvalidEncoding: unsupported protocol version {}.{}",
                version.major, version.minor)));
  }
  auto app_id = static_cast<uint16_t>(bytes[2] | (bytes[3] << 8));

  std::vector<Instruction> instructions;
  size_t count = (bytes.size() - kMetadataSize) / kCommandSize;
  instructions.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    auto command =
        bytes.subspan(kMetadataSize + (i * kCommandSize), kCommandSize);
    auto instr = DecodeInstruction(command, flavour);
    if (!instr) {
      return std::unexpected(
          std::move(instr).error().AtInstruction(
              InstrSpan{.index = static_cast<uint32_t>(i)}));
    }
    instructions.push_back(std::move(*instr));
  }

  Subroutine subroutine(version, app_id, std::move(instructions));
  auto valid = ValidateSubroutine(subroutine, flavour);
  if (!valid) {
    return std::unexpected(std::move(valid).error());
  }
  return subroutine;
}

}  // namespace netqasm::lang
