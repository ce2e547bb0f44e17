#include "netqasm/lang/gate.hpp"

#include <optional>
#include <string_view>

#include "netqasm/common/internal_error.hpp"

namespace netqasm::lang {

auto GateOpcode(Gate gate) -> Opcode {
  switch (gate) {
    case Gate::kX:
      return Opcode::kX;
    case Gate::kY:
      return Opcode::kY;
    case Gate::kZ:
      return Opcode::kZ;
    case Gate::kH:
      return Opcode::kH;
    case Gate::kS:
      return Opcode::kS;
    case Gate::kK:
      return Opcode::kK;
    case Gate::kT:
      return Opcode::kT;
    case Gate::kRotX:
      return Opcode::kRotX;
    case Gate::kRotY:
      return Opcode::kRotY;
    case Gate::kRotZ:
      return Opcode::kRotZ;
    case Gate::kCnot:
      return Opcode::kCnot;
    case Gate::kCphase:
      return Opcode::kCphase;
    case Gate::kCrotX:
      return Opcode::kCrotX;
    case Gate::kCrotY:
      return Opcode::kCrotY;
    case Gate::kMov:
      return Opcode::kMov;
  }
  common::ThrowInternalError("GateOpcode", "unknown gate");
}

auto OpcodeGate(Opcode opcode) -> std::optional<Gate> {
  switch (opcode) {
    case Opcode::kX:
      return Gate::kX;
    case Opcode::kY:
      return Gate::kY;
    case Opcode::kZ:
      return Gate::kZ;
    case Opcode::kH:
      return Gate::kH;
    case Opcode::kS:
      return Gate::kS;
    case Opcode::kK:
      return Gate::kK;
    case Opcode::kT:
      return Gate::kT;
    case Opcode::kRotX:
      return Gate::kRotX;
    case Opcode::kRotY:
      return Gate::kRotY;
    case Opcode::kRotZ:
      return Gate::kRotZ;
    case Opcode::kCnot:
      return Gate::kCnot;
    case Opcode::kCphase:
      return Gate::kCphase;
    case Opcode::kCrotX:
      return Gate::kCrotX;
    case Opcode::kCrotY:
      return Gate::kCrotY;
    case Opcode::kMov:
      return Gate::kMov;
    default:
      return std::nullopt;
  }
}

auto IsParameterized(Gate gate) -> bool {
  switch (gate) {
    case Gate::kRotX:
    case Gate::kRotY:
    case Gate::kRotZ:
    case Gate::kCrotX:
    case Gate::kCrotY:
      return true;
    default:
      return false;
  }
}

auto IsTwoQubit(Gate gate) -> bool {
  switch (gate) {
    case Gate::kCnot:
    case Gate::kCphase:
    case Gate::kCrotX:
    case Gate::kCrotY:
    case Gate::kMov:
      return true;
    default:
      return false;
  }
}

auto ToString(Gate gate) -> std::string_view {
  return ToString(GateOpcode(gate));
}

}  // namespace netqasm::lang
