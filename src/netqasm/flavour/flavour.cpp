#include "netqasm/flavour/flavour.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/lang/angle.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/lang/opcode.hpp"

namespace netqasm::flavour {

namespace {

using lang::Gate;
using lang::Opcode;

struct WireEntry {
  Opcode opcode;
  uint8_t id;
};

// Shared by both flavours.
constexpr std::array kCoreWireIds = {
    WireEntry{Opcode::kQAlloc, 1},      WireEntry{Opcode::kInit, 2},
    WireEntry{Opcode::kArray, 3},       WireEntry{Opcode::kSet, 4},
    WireEntry{Opcode::kStore, 5},       WireEntry{Opcode::kLoad, 6},
    WireEntry{Opcode::kUndef, 7},       WireEntry{Opcode::kLea, 8},
    WireEntry{Opcode::kJmp, 9},         WireEntry{Opcode::kBez, 10},
    WireEntry{Opcode::kBnz, 11},        WireEntry{Opcode::kBeq, 12},
    WireEntry{Opcode::kBne, 13},        WireEntry{Opcode::kBlt, 14},
    WireEntry{Opcode::kBge, 15},        WireEntry{Opcode::kAdd, 16},
    WireEntry{Opcode::kSub, 17},        WireEntry{Opcode::kAddm, 18},
    WireEntry{Opcode::kSubm, 19},       WireEntry{Opcode::kRotX, 27},
    WireEntry{Opcode::kRotY, 28},       WireEntry{Opcode::kRotZ, 29},
    WireEntry{Opcode::kMeas, 32},       WireEntry{Opcode::kCreateEpr, 33},
    WireEntry{Opcode::kRecvEpr, 34},    WireEntry{Opcode::kWaitAll, 35},
    WireEntry{Opcode::kWaitAny, 36},    WireEntry{Opcode::kWaitSingle, 37},
    WireEntry{Opcode::kQFree, 38},      WireEntry{Opcode::kRetReg, 39},
    WireEntry{Opcode::kRetArr, 40},     WireEntry{Opcode::kSend, 42},
    WireEntry{Opcode::kRecv, 43},       WireEntry{Opcode::kRet, 44},
    WireEntry{Opcode::kBreakpoint, 100}, WireEntry{Opcode::kMul, 200},
    WireEntry{Opcode::kDiv, 201},       WireEntry{Opcode::kRem, 202},
};

constexpr std::array kVanillaWireIds = {
    WireEntry{Opcode::kX, 20},      WireEntry{Opcode::kY, 21},
    WireEntry{Opcode::kZ, 22},      WireEntry{Opcode::kH, 23},
    WireEntry{Opcode::kS, 24},      WireEntry{Opcode::kK, 25},
    WireEntry{Opcode::kT, 26},      WireEntry{Opcode::kCnot, 30},
    WireEntry{Opcode::kCphase, 31}, WireEntry{Opcode::kMov, 41},
};

constexpr std::array kNvWireIds = {
    WireEntry{Opcode::kCrotX, 30},
    WireEntry{Opcode::kCrotY, 31},
};

template <size_t N>
void AddWireIds(Flavour& flavour, const std::array<WireEntry, N>& entries) {
  for (const auto& entry : entries) {
    flavour.wire_ids[static_cast<size_t>(entry.opcode)] = entry.id;
  }
}

auto Step(Gate gate, StepQubit qubit, int32_t angle_num = 0) -> NativeStep {
  return NativeStep{
      .gate = gate,
      .qubit = qubit,
      .other = StepQubit::kSecond,
      .angle_num = angle_num};
}

auto Step2(Gate gate, StepQubit control, StepQubit target, int32_t angle_num = 0)
    -> NativeStep {
  return NativeStep{
      .gate = gate, .qubit = control, .other = target, .angle_num = angle_num};
}

// SWAP(a, b) as three CNOTs, appended to `steps`.
void AppendSwap(std::vector<NativeStep>& steps, StepQubit a, StepQubit b) {
  steps.push_back(Step2(Gate::kCnot, a, b));
  steps.push_back(Step2(Gate::kCnot, b, a));
  steps.push_back(Step2(Gate::kCnot, a, b));
}

// Carbon-carbon gate routed through the electron: swap the first carbon into
// the electron, apply the electron-carbon gate, swap back.
auto ViaElectron(Gate gate) -> std::vector<NativeStep> {
  std::vector<NativeStep> steps;
  AppendSwap(steps, StepQubit::kElectron, StepQubit::kFirst);
  steps.push_back(Step2(gate, StepQubit::kElectron, StepQubit::kSecond));
  AppendSwap(steps, StepQubit::kElectron, StepQubit::kFirst);
  return steps;
}

// Angles are in units of pi / 16.
auto BuildNvDecompositions() -> DecompositionTable {
  using enum StepQubit;
  DecompositionTable table;
  auto single = [&](Gate gate, std::vector<NativeStep> steps) {
    table.emplace(
        DecompositionKey{.gate = gate, .topology = Topology::kSingle},
        std::move(steps));
  };

  single(Gate::kX, {Step(Gate::kRotX, kFirst, 16)});
  single(Gate::kY, {Step(Gate::kRotY, kFirst, 16)});
  single(
      Gate::kZ, {Step(Gate::kRotX, kFirst, 24), Step(Gate::kRotY, kFirst, 16),
                 Step(Gate::kRotX, kFirst, 8)});
  single(
      Gate::kH, {Step(Gate::kRotY, kFirst, 8), Step(Gate::kRotX, kFirst, 16)});
  single(
      Gate::kK, {Step(Gate::kRotX, kFirst, 24), Step(Gate::kRotY, kFirst, 16)});
  single(
      Gate::kS, {Step(Gate::kRotX, kFirst, 8), Step(Gate::kRotY, kFirst, 24),
                 Step(Gate::kRotX, kFirst, 24)});
  single(
      Gate::kT, {Step(Gate::kRotX, kFirst, 8), Step(Gate::kRotY, kFirst, 28),
                 Step(Gate::kRotX, kFirst, 24)});

  table.emplace(
      DecompositionKey{.gate = Gate::kCnot, .topology = Topology::kElectronCarbon},
      std::vector<NativeStep>{
          Step2(Gate::kCrotX, kFirst, kSecond, 8),
          Step(Gate::kRotZ, kFirst, 24),
          Step(Gate::kRotX, kSecond, 24),
      });
  table.emplace(
      DecompositionKey{
          .gate = Gate::kCphase, .topology = Topology::kElectronCarbon},
      std::vector<NativeStep>{
          Step(Gate::kRotY, kSecond, 8),
          Step2(Gate::kCrotX, kFirst, kSecond, 8),
          Step(Gate::kRotZ, kFirst, 24),
          Step(Gate::kRotX, kSecond, 24),
          Step(Gate::kRotY, kSecond, 24),
      });
  table.emplace(
      DecompositionKey{.gate = Gate::kCnot, .topology = Topology::kCarbonElectron},
      std::vector<NativeStep>{
          Step(Gate::kH, kSecond),
          Step2(Gate::kCphase, kSecond, kFirst),
          Step(Gate::kH, kSecond),
      });
  table.emplace(
      DecompositionKey{
          .gate = Gate::kCphase, .topology = Topology::kCarbonElectron},
      std::vector<NativeStep>{Step2(Gate::kCphase, kSecond, kFirst)});
  table.emplace(
      DecompositionKey{.gate = Gate::kCnot, .topology = Topology::kCarbonCarbon},
      ViaElectron(Gate::kCnot));
  table.emplace(
      DecompositionKey{.gate = Gate::kCphase, .topology = Topology::kCarbonCarbon},
      ViaElectron(Gate::kCphase));
  return table;
}

auto BuildVanilla() -> Flavour {
  Flavour flavour{.name = "vanilla"};
  AddWireIds(flavour, kCoreWireIds);
  AddWireIds(flavour, kVanillaWireIds);
  flavour.native_gates = {
      Gate::kX,    Gate::kY,    Gate::kZ,    Gate::kH,    Gate::kS,
      Gate::kK,    Gate::kT,    Gate::kRotX, Gate::kRotY, Gate::kRotZ,
      Gate::kCnot, Gate::kCphase, Gate::kMov,
  };
  return flavour;
}

auto BuildNv() -> Flavour {
  Flavour flavour{.name = "nv"};
  AddWireIds(flavour, kCoreWireIds);
  AddWireIds(flavour, kNvWireIds);
  flavour.native_gates = {
      Gate::kRotX, Gate::kRotY, Gate::kRotZ, Gate::kCrotX, Gate::kCrotY,
  };
  flavour.decompositions = BuildNvDecompositions();
  flavour.fixed_denom_exp = 4;
  flavour.step_denom_exp = 4;
  flavour.electron_virtual_id = 0;
  return flavour;
}

}  // namespace

auto Flavour::OpcodeFromWire(uint8_t wire_id) const
    -> std::optional<lang::Opcode> {
  for (size_t i = 0; i < wire_ids.size(); ++i) {
    if (wire_ids[i] == wire_id) {
      return static_cast<lang::Opcode>(i);
    }
  }
  return std::nullopt;
}

auto Flavour::IsNative(lang::Gate gate) const -> bool {
  return std::ranges::find(native_gates, gate) != native_gates.end();
}

auto Flavour::FindDecomposition(lang::Gate gate, Topology topology) const
    -> const std::vector<NativeStep>* {
  auto it =
      decompositions.find(DecompositionKey{.gate = gate, .topology = topology});
  if (it == decompositions.end()) {
    return nullptr;
  }
  return &it->second;
}

auto Flavour::CanonicalAngle(lang::Angle angle) const -> lang::Angle {
  if (fixed_denom_exp) {
    return angle.AtExponent(*fixed_denom_exp);
  }
  return angle.Reduced();
}

auto Vanilla() -> const Flavour& {
  static const Flavour kVanilla = BuildVanilla();
  return kVanilla;
}

auto Nv() -> const Flavour& {
  static const Flavour kNv = BuildNv();
  return kNv;
}

auto FlavourByName(std::string_view name) -> Result<const Flavour*> {
  if (name == "vanilla") {
    return &Vanilla();
  }
  if (name == "nv") {
    return &Nv();
  }
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("unknown flavour '{}' (expected vanilla or nv)", name)));
}

}  // namespace netqasm::flavour
