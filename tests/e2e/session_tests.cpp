#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/builder.hpp"
#include "netqasm/compiler/operation.hpp"
#include "netqasm/config/session_config.hpp"
#include "netqasm/lang/gate.hpp"
#include "netqasm/runtime/session.hpp"
#include "tests/common/recording_processor.hpp"

auto main(int argc, char** argv) -> int {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

namespace netqasm::runtime {
namespace {

using compiler::CompareOp;
using lang::Gate;

class SessionTest : public testing::Test {
 protected:
  auto MakeSession(std::string flavour = "vanilla") -> Session& {
    config_.flavour = std::move(flavour);
    session_.emplace(config_, processor_);
    return *session_;
  }

  config::SessionConfig config_;
  test::RecordingProcessor processor_;
  std::optional<Session> session_;
};

TEST_F(SessionTest, MeasuresAndReturnsOutcome) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  processor_.outcomes = {1};

  auto q = b.AllocQubit();
  b.Apply(Gate::kH, q);
  auto m = b.Measure(q);
  b.FreeQubit(q);

  auto flushed = session.Flush();
  ASSERT_TRUE(flushed.has_value()) << flushed.error().Message();
  EXPECT_EQ(
      processor_.calls, (std::vector<std::string>{
                            "alloc 0", "init 0", "h 0", "meas 0 -> 1",
                            "free 0"}));
  auto value = session.Read(m.future);
  ASSERT_TRUE(value.has_value()) << value.error().Message();
  EXPECT_EQ(*value, 1);
  EXPECT_EQ(session.SubroutinesRun(), 1U);
}

TEST_F(SessionTest, FutureIsUnavailableBeforeFlush) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto v = b.Set(7);
  auto future = b.ReturnValue(v);

  auto early = session.Read(future);
  ASSERT_FALSE(early.has_value());
  EXPECT_EQ(early.error().Kind(), DiagKind::kNotYetAvailable);

  ASSERT_TRUE(session.Flush().has_value());
  auto late = session.Read(future);
  ASSERT_TRUE(late.has_value()) << late.error().Message();
  EXPECT_EQ(*late, 7);
}

TEST_F(SessionTest, ArithmeticAcrossValues) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto a = b.Set(6);
  auto sum = b.Add(a, 4);
  auto product = b.Mul(sum, a);
  auto diff = b.Sub(product, 1);
  auto future = b.ReturnValue(diff);

  ASSERT_TRUE(session.Flush().has_value());
  EXPECT_EQ(session.Read(future).value_or(-1), 59);
}

TEST_F(SessionTest, ArrayReturnedWhole) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto array = b.NewArray(3);
  b.Store(array, 0, 10);
  b.Store(array, 2, 30);
  auto loaded = b.Load(array, 2);
  b.Store(array, 1, loaded);
  auto future = b.ReturnArray(array);

  ASSERT_TRUE(session.Flush().has_value());
  auto values = session.ReadArray(future);
  ASSERT_TRUE(values.has_value()) << values.error().Message();
  ASSERT_EQ(values->size(), 3U);
  EXPECT_EQ((*values)[0], 10);
  EXPECT_EQ((*values)[1], 30);
  EXPECT_EQ((*values)[2], 30);
  EXPECT_EQ(session.ReadEntry(future, 1).value_or(-1), 30);
}

TEST_F(SessionTest, UndefinedArrayEntryReadsAsExecutionError) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto array = b.NewArray(2);
  b.Store(array, 0, 5);
  auto future = b.ReturnArray(array);

  ASSERT_TRUE(session.Flush().has_value());
  auto entry = session.ReadEntry(future, 1);
  ASSERT_FALSE(entry.has_value());
  EXPECT_EQ(entry.error().Kind(), DiagKind::kExecution);
}

// ============================================================================
// Control flow
// ============================================================================

TEST_F(SessionTest, IfTakesThenBranch) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  processor_.outcomes = {1};

  auto q = b.AllocQubit();
  auto m = b.Measure(q);
  b.BeginIf(m.value, CompareOp::kEq, 1);
  b.Apply(Gate::kX, q);
  ASSERT_TRUE(b.BeginElse().has_value());
  b.Apply(Gate::kZ, q);
  ASSERT_TRUE(b.EndIf().has_value());
  b.FreeQubit(q);

  ASSERT_TRUE(session.Flush().has_value());
  EXPECT_EQ(
      processor_.calls, (std::vector<std::string>{
                            "alloc 0", "init 0", "meas 0 -> 1", "x 0",
                            "free 0"}));
}

TEST_F(SessionTest, IfTakesElseBranch) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  processor_.outcomes = {0};

  auto q = b.AllocQubit();
  auto m = b.Measure(q);
  b.BeginIf(m.value, CompareOp::kEq, 1);
  b.Apply(Gate::kX, q);
  ASSERT_TRUE(b.BeginElse().has_value());
  b.Apply(Gate::kZ, q);
  ASSERT_TRUE(b.EndIf().has_value());
  b.FreeQubit(q);

  ASSERT_TRUE(session.Flush().has_value());
  EXPECT_EQ(
      processor_.calls, (std::vector<std::string>{
                            "alloc 0", "init 0", "meas 0 -> 0", "z 0",
                            "free 0"}));
}

TEST_F(SessionTest, LoopRepeatsBody) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();

  auto q = b.AllocQubit();
  auto total = b.Set(0);
  b.BeginLoop(3);
  b.Apply(Gate::kX, q);
  ASSERT_TRUE(b.EndLoop().has_value());
  auto future = b.ReturnValue(total);
  b.FreeQubit(q);

  ASSERT_TRUE(session.Flush().has_value());
  EXPECT_EQ(
      processor_.calls, (std::vector<std::string>{
                            "alloc 0", "init 0", "x 0", "x 0", "x 0",
                            "free 0"}));
  EXPECT_EQ(session.Read(future).value_or(-1), 0);
}

TEST_F(SessionTest, LoopCounterCountsFromZero) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();

  auto array = b.NewArray(4);
  auto counter = b.BeginLoop(4);
  auto squared = b.Mul(counter, counter);
  b.Store(array, counter, squared);
  ASSERT_TRUE(b.EndLoop().has_value());
  auto future = b.ReturnArray(array);

  ASSERT_TRUE(session.Flush().has_value());
  auto values = session.ReadArray(future);
  ASSERT_TRUE(values.has_value()) << values.error().Message();
  EXPECT_EQ(*values, (vm::ArrayValues{0, 1, 4, 9}));
}

TEST_F(SessionTest, UnclosedBlockFailsFlush) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto v = b.Set(1);
  b.BeginIf(v, CompareOp::kNe, 0);

  auto flushed = session.Flush();
  ASSERT_FALSE(flushed.has_value());
  EXPECT_EQ(flushed.error().Kind(), DiagKind::kCompile);
  EXPECT_EQ(b.PendingOperations(), 0U);
  EXPECT_TRUE(processor_.calls.empty());
}

// ============================================================================
// Misuse across flushes
// ============================================================================

TEST_F(SessionTest, ValueFromEarlierFlushIsRejected) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto v = b.Set(3);
  ASSERT_TRUE(session.Flush().has_value());

  b.Add(v, 1);
  auto flushed = session.Flush();
  ASSERT_FALSE(flushed.has_value());
  EXPECT_EQ(flushed.error().Kind(), DiagKind::kCompile);
}

TEST_F(SessionTest, QubitsSurviveAcrossFlushes) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto q = b.AllocQubit();
  ASSERT_TRUE(session.Flush().has_value());

  b.Apply(Gate::kY, q);
  b.FreeQubit(q);
  ASSERT_TRUE(session.Flush().has_value());
  EXPECT_EQ(
      processor_.calls, (std::vector<std::string>{
                            "alloc 0", "init 0", "y 0", "free 0"}));
  EXPECT_EQ(session.SubroutinesRun(), 2U);
}

TEST_F(SessionTest, GateOnFreedQubitFailsFlush) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto q = b.AllocQubit();
  b.FreeQubit(q);
  b.Apply(Gate::kX, q);

  auto flushed = session.Flush();
  ASSERT_FALSE(flushed.has_value());
  EXPECT_EQ(flushed.error().Kind(), DiagKind::kCompile);
  EXPECT_TRUE(processor_.calls.empty());
}

TEST_F(SessionTest, InexactRadiansWarn) {
  auto& session = MakeSession();
  auto& b = session.GetBuilder();
  auto q = b.AllocQubit();
  b.RotateRadians(Gate::kRotZ, q, 1.0);
  b.RotateRadians(Gate::kRotZ, q, 3.141592653589793 / 2);
  b.FreeQubit(q);

  ASSERT_TRUE(session.Flush().has_value());
  const auto& warnings = b.Warnings().GetDiagnostics();
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].Kind(), DiagKind::kWarning);
}

TEST_F(SessionTest, UnknownFlavourThrows) {
  config_.flavour = "superconducting";
  EXPECT_THROW(Session(config_, processor_), DiagnosticException);
}

// ============================================================================
// NV
// ============================================================================

TEST_F(SessionTest, NvSessionRunsDecomposedGates) {
  auto& session = MakeSession("nv");
  auto& b = session.GetBuilder();
  auto electron = b.AllocQubit();
  auto carbon = b.AllocQubit();
  b.Apply(Gate::kH, electron);
  b.Apply(Gate::kCnot, electron, carbon);
  b.FreeQubit(carbon);
  b.FreeQubit(electron);

  auto flushed = session.Flush();
  ASSERT_TRUE(flushed.has_value()) << flushed.error().Message();
  for (const auto& call : processor_.calls) {
    EXPECT_NE(call.rfind("h ", 0), 0U) << call;
    EXPECT_NE(call.rfind("cnot ", 0), 0U) << call;
  }
  EXPECT_EQ(processor_.calls.front(), "alloc 0");
  EXPECT_EQ(processor_.calls.back(), "free 0");
}

}  // namespace
}  // namespace netqasm::runtime
