#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/host_line.hpp"
#include "netqasm/lang/instruction.hpp"

namespace netqasm::flavour {
struct Flavour;
}

namespace netqasm::lang {

struct ProtocolVersion {
  uint8_t major = 1;
  uint8_t minor = 0;

  auto operator==(const ProtocolVersion&) const -> bool = default;
};

inline constexpr ProtocolVersion kCurrentVersion{.major = 1, .minor = 0};

// Maps instruction indices to the host lines that produced them.
// Diagnostic only: never consulted for semantics.
class DebugMap {
 public:
  void Record(uint32_t index, HostLine line) {
    entries_.insert_or_assign(index, std::move(line));
  }

  [[nodiscard]] auto Resolve(uint32_t index) const
      -> std::optional<HostLine> {
    auto it = entries_.find(index);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  auto operator==(const DebugMap&) const -> bool = default;

 private:
  std::map<uint32_t, HostLine> entries_;
};

// Finalized, immutable instruction sequence. All branch targets are absolute
// instruction indices.
class Subroutine {
 public:
  Subroutine() = default;
  Subroutine(
      ProtocolVersion version, uint16_t app_id,
      std::vector<Instruction> instructions, DebugMap debug_map = {})
      : version_(version),
        app_id_(app_id),
        instructions_(std::move(instructions)),
        debug_map_(std::move(debug_map)) {
  }

  [[nodiscard]] auto Version() const -> ProtocolVersion {
    return version_;
  }
  [[nodiscard]] auto AppId() const -> uint16_t {
    return app_id_;
  }
  [[nodiscard]] auto Instructions() const -> const std::vector<Instruction>& {
    return instructions_;
  }
  [[nodiscard]] auto Size() const -> size_t {
    return instructions_.size();
  }
  [[nodiscard]] auto operator[](size_t index) const -> const Instruction& {
    return instructions_[index];
  }
  [[nodiscard]] auto GetDebugMap() const -> const DebugMap& {
    return debug_map_;
  }

  // Span of an instruction, with its host line when recorded.
  [[nodiscard]] auto SpanOf(uint32_t index) const -> InstrSpan {
    return InstrSpan{.index = index, .host_line = debug_map_.Resolve(index)};
  }

  // Equality ignores the debug map.
  auto operator==(const Subroutine& other) const -> bool {
    return version_ == other.version_ && app_id_ == other.app_id_ &&
           instructions_ == other.instructions_;
  }

 private:
  ProtocolVersion version_ = kCurrentVersion;
  uint16_t app_id_ = 0;
  std::vector<Instruction> instructions_;
  DebugMap debug_map_;
};

// Appends instructions and labels in program order, then resolves labels
// and validates the result against a flavour.
class SubroutineBuilder {
 public:
  explicit SubroutineBuilder(uint16_t app_id = 0) : app_id_(app_id) {
  }

  void SetAppId(uint16_t app_id) {
    app_id_ = app_id;
  }
  void SetVersion(ProtocolVersion version) {
    version_ = version;
  }

  // Appends an instruction. Branch targets may be LabelRef operands.
  auto Append(Instruction instr, std::optional<HostLine> host_line = {})
      -> uint32_t;

  // Places a label before the next appended instruction.
  void PlaceLabel(std::string name, std::optional<HostLine> host_line = {});

  [[nodiscard]] auto Size() const -> size_t {
    return instructions_.size();
  }

  // Checks labels, operand shapes, register and array budgets and opcode
  // support, then produces the immutable subroutine.
  [[nodiscard]] auto Finalize(const flavour::Flavour& flavour) &&
      -> Result<Subroutine>;

 private:
  struct PlacedLabel {
    std::string name;
    uint32_t index;
    std::optional<HostLine> host_line;
  };

  ProtocolVersion version_ = kCurrentVersion;
  uint16_t app_id_ = 0;
  std::vector<Instruction> instructions_;
  std::vector<std::optional<HostLine>> host_lines_;
  std::vector<PlacedLabel> labels_;
};

// Validates a decoded or constructed subroutine against a flavour:
// operand shapes, opcode support, register and array budgets, branch range.
auto ValidateSubroutine(
    const Subroutine& subroutine, const flavour::Flavour& flavour)
    -> Result<void>;

}  // namespace netqasm::lang
