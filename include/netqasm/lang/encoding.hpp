#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/instruction.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::flavour {
struct Flavour;
}

namespace netqasm::lang {

inline constexpr size_t kCommandSize = 7;
inline constexpr size_t kMetadataSize = 4;

// Register byte: bank in bits 0-1, index in bits 2-5, bits 6-7 zero.
[[nodiscard]] auto EncodeRegister(const Register& reg) -> uint8_t;
[[nodiscard]] auto DecodeRegister(uint8_t byte) -> Result<Register>;

// Appends the 7-byte command for `instr`. Rotation angles are canonicalized
// for the flavour before being written.
auto EncodeInstruction(
    const Instruction& instr, const flavour::Flavour& flavour,
    std::vector<uint8_t>& out) -> Result<void>;

auto DecodeInstruction(
    std::span<const uint8_t> command, const flavour::Flavour& flavour)
    -> Result<Instruction>;

// Metadata header followed by one command per instruction.
auto EncodeSubroutine(
    const Subroutine& subroutine, const flavour::Flavour& flavour)
    -> Result<std::vector<uint8_t>>;

// Inverse of EncodeSubroutine. The result is validated against the flavour.
auto DecodeSubroutine(
    std::span<const uint8_t> bytes, const flavour::Flavour& flavour)
    -> Result<Subroutine>;

}  // namespace netqasm::lang
