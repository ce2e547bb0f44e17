#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/builder.hpp"
#include "netqasm/compiler/operation.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/subroutine.hpp"

namespace netqasm::compiler {
namespace {

using lang::Gate;
using lang::Opcode;

// Opcodes of the compiled subroutine with the `set` instructions dropped.
auto OpcodesWithoutSets(const lang::Subroutine& subroutine)
    -> std::vector<Opcode> {
  std::vector<Opcode> out;
  for (const auto& instr : subroutine.Instructions()) {
    if (instr.opcode != Opcode::kSet) {
      out.push_back(instr.opcode);
    }
  }
  return out;
}

class CompilerTest : public testing::Test {
 protected:
  Builder builder_{flavour::Vanilla(), BuilderOptions{.app_id = 5}};
};

TEST_F(CompilerTest, StraightLineProgram) {
  auto q = builder_.AllocQubit();
  builder_.Apply(Gate::kH, q);
  builder_.Measure(q);
  builder_.FreeQubit(q);
  EXPECT_EQ(builder_.PendingOperations(), 4U);

  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  EXPECT_EQ(compiled->subroutine.AppId(), 5);
  EXPECT_EQ(
      OpcodesWithoutSets(compiled->subroutine),
      (std::vector<Opcode>{
          Opcode::kQAlloc, Opcode::kInit, Opcode::kH, Opcode::kMeas,
          Opcode::kQFree, Opcode::kRetReg}));
  ASSERT_EQ(compiled->register_futures.size(), 1U);
  EXPECT_EQ(compiled->register_futures[0].second.bank, lang::RegisterBank::kM);
  EXPECT_EQ(builder_.PendingOperations(), 0U);
  EXPECT_TRUE(
      lang::ValidateSubroutine(compiled->subroutine, flavour::Vanilla())
          .has_value());
}

TEST_F(CompilerTest, QubitRegisterHoldsVirtualId) {
  auto a = builder_.AllocQubit();
  auto b = builder_.AllocQubit();
  builder_.Apply(Gate::kCnot, a, b);

  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  const auto& instrs = compiled->subroutine.Instructions();
  ASSERT_GE(instrs.size(), 2U);
  EXPECT_EQ(instrs[0].opcode, Opcode::kSet);
  EXPECT_EQ(instrs[0].Reg(0).bank, lang::RegisterBank::kQ);
  EXPECT_EQ(instrs[0].Imm(1), 0);
}

TEST_F(CompilerTest, IfElseLowersToNegatedBranch) {
  auto q = builder_.AllocQubit();
  auto m = builder_.Measure(q);
  builder_.BeginIf(m.value, CompareOp::kEq, 1);
  builder_.Apply(Gate::kX, q);
  ASSERT_TRUE(builder_.BeginElse().has_value());
  builder_.Apply(Gate::kZ, q);
  ASSERT_TRUE(builder_.EndIf().has_value());

  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  EXPECT_EQ(
      OpcodesWithoutSets(compiled->subroutine),
      (std::vector<Opcode>{
          Opcode::kQAlloc, Opcode::kInit, Opcode::kMeas, Opcode::kBne,
          Opcode::kX, Opcode::kJmp, Opcode::kZ, Opcode::kRetReg}));
}

TEST_F(CompilerTest, LessThanBranchesOnGreaterOrEqual) {
  auto v = builder_.Set(2);
  builder_.BeginIf(v, CompareOp::kLt, 5);
  builder_.Add(v, 1);
  ASSERT_TRUE(builder_.EndIf().has_value());

  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  auto opcodes = OpcodesWithoutSets(compiled->subroutine);
  ASSERT_FALSE(opcodes.empty());
  EXPECT_EQ(opcodes[0], Opcode::kBge);
}

TEST_F(CompilerTest, LoopLowersToCountedBranch) {
  auto q = builder_.AllocQubit();
  builder_.BeginLoop(2);
  builder_.Apply(Gate::kX, q);
  ASSERT_TRUE(builder_.EndLoop().has_value());

  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  EXPECT_EQ(
      OpcodesWithoutSets(compiled->subroutine),
      (std::vector<Opcode>{
          Opcode::kQAlloc, Opcode::kInit, Opcode::kBeq, Opcode::kX,
          Opcode::kAdd, Opcode::kJmp}));
  EXPECT_TRUE(
      lang::ValidateSubroutine(compiled->subroutine, flavour::Vanilla())
          .has_value());
}

// ============================================================================
// Misuse
// ============================================================================

TEST_F(CompilerTest, ElseWithoutIf) {
  auto r = builder_.BeginElse();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().Kind(), DiagKind::kCompile);
}

TEST_F(CompilerTest, SecondElseRejected) {
  auto v = builder_.Set(0);
  builder_.BeginIf(v, CompareOp::kEq, 0);
  ASSERT_TRUE(builder_.BeginElse().has_value());
  auto r = builder_.BeginElse();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().Kind(), DiagKind::kCompile);
}

TEST_F(CompilerTest, MismatchedBlockEnd) {
  builder_.BeginLoop(1);
  auto r = builder_.EndIf();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().Kind(), DiagKind::kCompile);
}

TEST_F(CompilerTest, NegativeLoopCount) {
  builder_.BeginLoop(-1);
  ASSERT_TRUE(builder_.EndLoop().has_value());
  auto compiled = builder_.Flush();
  ASSERT_FALSE(compiled.has_value());
  EXPECT_EQ(compiled.error().Kind(), DiagKind::kCompile);
}

TEST_F(CompilerTest, SameQubitTwiceInTwoQubitGate) {
  auto q = builder_.AllocQubit();
  builder_.Apply(Gate::kCnot, q, q);
  auto compiled = builder_.Flush();
  ASSERT_FALSE(compiled.has_value());
  EXPECT_EQ(compiled.error().Kind(), DiagKind::kCompile);
}

TEST_F(CompilerTest, FailedFlushRestoresQubitState) {
  auto q = builder_.AllocQubit();
  ASSERT_TRUE(builder_.Flush().has_value());

  builder_.FreeQubit(q);
  builder_.Apply(Gate::kX, q);
  ASSERT_FALSE(builder_.Flush().has_value());

  // The free was discarded with the failed flush.
  builder_.Apply(Gate::kX, q);
  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  EXPECT_EQ(
      OpcodesWithoutSets(compiled->subroutine),
      (std::vector<Opcode>{Opcode::kX}));
}

TEST_F(CompilerTest, TooManyLiveValuesIsLayoutError) {
  std::vector<ValueId> values;
  for (int32_t i = 0; i < 17; ++i) {
    values.push_back(builder_.Set(i));
  }
  for (auto value : values) {
    builder_.ReturnValue(value);
  }
  auto compiled = builder_.Flush();
  ASSERT_FALSE(compiled.has_value());
  EXPECT_EQ(compiled.error().Kind(), DiagKind::kLayout);
}

TEST_F(CompilerTest, SixteenLiveValuesFit) {
  std::vector<ValueId> values;
  for (int32_t i = 0; i < 16; ++i) {
    values.push_back(builder_.Set(i));
  }
  for (auto value : values) {
    builder_.ReturnValue(value);
  }
  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  EXPECT_EQ(compiled->register_futures.size(), 16U);
}

TEST_F(CompilerTest, ArrayAddressesAreDistinct) {
  auto a = builder_.NewArray(2);
  auto b = builder_.NewArray(3);
  builder_.ReturnArray(a);
  builder_.ReturnArray(b);

  auto compiled = builder_.Flush();
  ASSERT_TRUE(compiled.has_value()) << compiled.error().Message();
  ASSERT_EQ(compiled->array_futures.size(), 2U);
  EXPECT_NE(
      compiled->array_futures[0].second, compiled->array_futures[1].second);
}

}  // namespace
}  // namespace netqasm::compiler
