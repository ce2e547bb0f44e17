#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/builder.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/subroutine.hpp"
#include "tests/common/unitary.hpp"

namespace netqasm::flavour {
namespace {

using lang::Gate;
using lang::Opcode;

constexpr double kTolerance = 1e-9;

TEST(FlavourTest, LookupByName) {
  auto vanilla = FlavourByName("vanilla");
  ASSERT_TRUE(vanilla.has_value());
  EXPECT_EQ((*vanilla)->name, "vanilla");

  auto nv = FlavourByName("nv");
  ASSERT_TRUE(nv.has_value());
  EXPECT_EQ((*nv)->name, "nv");

  auto unknown = FlavourByName("ion_trap");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().Kind(), DiagKind::kHostError);
}

TEST(FlavourTest, VanillaWireIds) {
  const auto& vanilla = Vanilla();
  EXPECT_EQ(vanilla.WireId(Opcode::kQAlloc), 1);
  EXPECT_EQ(vanilla.WireId(Opcode::kSet), 4);
  EXPECT_EQ(vanilla.WireId(Opcode::kX), 20);
  EXPECT_EQ(vanilla.WireId(Opcode::kH), 23);
  EXPECT_EQ(vanilla.WireId(Opcode::kCnot), 30);
  EXPECT_EQ(vanilla.WireId(Opcode::kMov), 41);
  EXPECT_EQ(vanilla.WireId(Opcode::kRet), 44);
  EXPECT_FALSE(vanilla.Supports(Opcode::kCrotX));
}

TEST(FlavourTest, NvWireIds) {
  const auto& nv = Nv();
  EXPECT_EQ(nv.WireId(Opcode::kSet), 4);
  EXPECT_EQ(nv.WireId(Opcode::kCrotX), 30);
  EXPECT_EQ(nv.WireId(Opcode::kCrotY), 31);
  EXPECT_FALSE(nv.Supports(Opcode::kH));
  EXPECT_FALSE(nv.Supports(Opcode::kCnot));
  EXPECT_EQ(nv.OpcodeFromWire(30), Opcode::kCrotX);
  EXPECT_EQ(Vanilla().OpcodeFromWire(30), Opcode::kCnot);
}

TEST(FlavourTest, WireIdsAreUniquePerFlavour) {
  for (const Flavour* flavour : {&Vanilla(), &Nv()}) {
    std::vector<uint8_t> seen;
    for (const auto& id : flavour->wire_ids) {
      if (!id) {
        continue;
      }
      EXPECT_EQ(std::ranges::count(seen, *id), 0)
          << flavour->name << " reuses wire id " << int{*id};
      seen.push_back(*id);
    }
  }
}

TEST(FlavourTest, CanonicalAngles) {
  EXPECT_EQ(
      Vanilla().CanonicalAngle(lang::Angle{.num = 4, .denom_exp = 3}),
      (lang::Angle{1, 1}));
  EXPECT_EQ(
      Nv().CanonicalAngle(lang::Angle{.num = 1, .denom_exp = 1}),
      (lang::Angle{8, 4}));
}

// ============================================================================
// NV decompositions, checked against the reference unitaries
// ============================================================================

// Qubit 0 takes virtual id 0, the electron; qubits 1 and 2 are carbons.
constexpr int32_t kQubits = 3;

auto CompileGate(Gate gate, std::vector<int32_t> targets) -> lang::Subroutine {
  compiler::Builder builder(Nv());
  std::vector<compiler::QubitId> qubits;
  for (int32_t i = 0; i < kQubits; ++i) {
    qubits.push_back(builder.AllocQubit());
  }
  if (targets.size() == 1) {
    builder.Apply(gate, qubits[targets[0]]);
  } else {
    builder.Apply(gate, qubits[targets[0]], qubits[targets[1]]);
  }
  auto compiled = builder.Flush();
  EXPECT_TRUE(compiled.has_value()) << compiled.error().Message();
  if (!compiled) {
    return {};
  }
  return std::move(compiled->subroutine);
}

void ExpectMatchesReference(Gate gate, const std::vector<int32_t>& targets) {
  auto subroutine = CompileGate(gate, targets);
  for (const auto& instr : subroutine.Instructions()) {
    auto as_gate = lang::OpcodeGate(instr.opcode);
    if (as_gate) {
      EXPECT_TRUE(Nv().IsNative(*as_gate)) << lang::ToString(instr);
    }
  }
  auto actual = test::SubroutineUnitary(subroutine, kQubits);
  auto expected = test::Embed(
      test::GateMatrix(gate, std::nullopt), targets, kQubits);
  EXPECT_TRUE(test::EqualUpToPhase(actual, expected, kTolerance))
      << lang::ToString(gate) << " on " << fmt::format("{}", targets[0])
      << (targets.size() > 1 ? fmt::format(",{}", targets[1]) : "");
}

TEST(FlavourTest, NvSingleQubitDecompositions) {
  for (Gate gate :
       {Gate::kX, Gate::kY, Gate::kZ, Gate::kH, Gate::kS, Gate::kK,
        Gate::kT}) {
    ExpectMatchesReference(gate, {0});
    ExpectMatchesReference(gate, {2});
  }
}

TEST(FlavourTest, NvElectronCarbonDecompositions) {
  ExpectMatchesReference(Gate::kCnot, {0, 1});
  ExpectMatchesReference(Gate::kCphase, {0, 2});
}

TEST(FlavourTest, NvCarbonElectronDecompositions) {
  ExpectMatchesReference(Gate::kCnot, {1, 0});
  ExpectMatchesReference(Gate::kCphase, {2, 0});
}

TEST(FlavourTest, NvCarbonCarbonDecompositions) {
  ExpectMatchesReference(Gate::kCnot, {1, 2});
  ExpectMatchesReference(Gate::kCnot, {2, 1});
  ExpectMatchesReference(Gate::kCphase, {1, 2});
}

TEST(FlavourTest, NvNativeRotationsPassThrough) {
  compiler::Builder builder(Nv());
  auto q = builder.AllocQubit();
  builder.Rotate(Gate::kRotY, q, lang::Angle{.num = 1, .denom_exp = 1});
  auto compiled = builder.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  int rotations = 0;
  for (const auto& instr : compiled->subroutine.Instructions()) {
    if (instr.opcode == Opcode::kRotY) {
      ++rotations;
      EXPECT_EQ(lang::GetAngle(instr), (lang::Angle{8, 4}));
    }
  }
  EXPECT_EQ(rotations, 1);
}

TEST(FlavourTest, CarbonCarbonGateNeedsElectron) {
  compiler::Builder builder(Nv());
  auto electron = builder.AllocQubit();
  auto c1 = builder.AllocQubit();
  auto c2 = builder.AllocQubit();
  builder.FreeQubit(electron);
  builder.Apply(Gate::kCnot, c1, c2);
  auto compiled = builder.Flush();
  ASSERT_FALSE(compiled.has_value());
  EXPECT_EQ(compiled.error().Kind(), DiagKind::kCompile);
}

TEST(FlavourTest, VanillaKeepsGatesNative) {
  compiler::Builder builder(Vanilla());
  auto a = builder.AllocQubit();
  auto b = builder.AllocQubit();
  builder.Apply(Gate::kH, a);
  builder.Apply(Gate::kCnot, a, b);
  auto compiled = builder.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  std::vector<Opcode> gates;
  for (const auto& instr : compiled->subroutine.Instructions()) {
    if (lang::OpcodeGate(instr.opcode)) {
      gates.push_back(instr.opcode);
    }
  }
  EXPECT_EQ(gates, (std::vector<Opcode>{Opcode::kH, Opcode::kCnot}));
}

}  // namespace
}  // namespace netqasm::flavour
