#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/builder.hpp"
#include "netqasm/compiler/lowering.hpp"
#include "netqasm/compiler/operation.hpp"
#include "netqasm/compiler/register_allocator.hpp"
#include "netqasm/flavour/flavour.hpp"
#include "netqasm/compiler/virtual_program.hpp"
#include "netqasm/lang/opcode.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::compiler {
namespace {

using lang::Opcode;
using lang::Register;
using lang::RegisterBank;

auto R(uint32_t id) -> VReg {
  return VReg{.bank = RegisterBank::kR, .id = id};
}

auto Q(uint32_t id) -> VReg {
  return VReg{.bank = RegisterBank::kQ, .id = id};
}

auto Instr(Opcode opcode, std::vector<VOperand> operands) -> VInstr {
  return VInstr{.opcode = opcode, .operands = std::move(operands)};
}

auto Set(VReg reg, int32_t value) -> VInstr {
  return Instr(Opcode::kSet, {reg, lang::Immediate{value}});
}

auto IntervalOf(const std::vector<LiveInterval>& intervals, VReg reg)
    -> LiveInterval {
  for (const auto& interval : intervals) {
    if (interval.reg == reg) {
      return interval;
    }
  }
  ADD_FAILURE() << "no interval for v" << reg.id;
  return {};
}

TEST(RegisterAllocatorTest, StraightLineIntervals) {
  VProgram program{
      .instrs =
          {
              Set(R(0), 1),
              Set(R(1), 2),
              Instr(Opcode::kAdd, {R(2), R(0), R(1)}),
              Set(R(3), 4),
          },
      .labels = {},
      .loops = {},
      .num_vregs = 4,
  };
  auto intervals = ComputeLiveIntervals(program);
  ASSERT_EQ(intervals.size(), 4U);
  EXPECT_EQ(intervals[0], (LiveInterval{.reg = R(0), .start = 0, .end = 2}));
  EXPECT_EQ(intervals[1], (LiveInterval{.reg = R(1), .start = 1, .end = 2}));
  EXPECT_EQ(intervals[2], (LiveInterval{.reg = R(2), .start = 2, .end = 2}));
  EXPECT_EQ(intervals[3], (LiveInterval{.reg = R(3), .start = 3, .end = 3}));
}

TEST(RegisterAllocatorTest, RegisterReusedOnlyAfterIntervalEnds) {
  VProgram program{
      .instrs =
          {
              Set(R(0), 1),
              Set(R(1), 2),
              Instr(Opcode::kAdd, {R(2), R(0), R(1)}),
              Set(R(3), 4),
          },
      .labels = {},
      .loops = {},
      .num_vregs = 4,
  };
  auto intervals = ComputeLiveIntervals(program);
  auto assignment = AllocateRegisters(intervals, 16);
  ASSERT_TRUE(assignment.has_value()) << assignment.error().Message();
  EXPECT_EQ(assignment->at(R(0)), Register::R(0));
  EXPECT_EQ(assignment->at(R(1)), Register::R(1));
  // R0 and R1 are still live at instruction 2.
  EXPECT_EQ(assignment->at(R(2)), Register::R(2));
  // Everything before instruction 3 has ended.
  EXPECT_EQ(assignment->at(R(3)), Register::R(0));
  EXPECT_TRUE(VerifyAssignment(intervals, *assignment).has_value());
}

TEST(RegisterAllocatorTest, BanksAreIndependent) {
  VProgram program{
      .instrs =
          {
              Set(Q(0), 0),
              Set(R(1), 1),
              Instr(Opcode::kQAlloc, {Q(0)}),
              Instr(Opcode::kMeas, {Q(0), VReg{RegisterBank::kM, 2}}),
          },
      .labels = {},
      .loops = {},
      .num_vregs = 3,
  };
  auto assignment = AllocateRegisters(ComputeLiveIntervals(program), 16);
  ASSERT_TRUE(assignment.has_value()) << assignment.error().Message();
  EXPECT_EQ(assignment->at(Q(0)), Register::Q(0));
  EXPECT_EQ(assignment->at(R(1)), Register::R(0));
  EXPECT_EQ(assignment->at((VReg{RegisterBank::kM, 2})), Register::M(0));
}

TEST(RegisterAllocatorTest, ValuesCrossingLoopLiveForWholeLoop) {
  // 0: set c 0
  // 1: set n 3
  // 2: beq c n END      <- loop begin
  // 3: set one 1
  // 4: add c c one
  // 5: jmp 2            <- loop end
  VProgram program{
      .instrs =
          {
              Set(R(0), 0),
              Set(R(1), 3),
              Instr(Opcode::kBeq, {R(0), R(1), lang::LabelRef{"END"}}),
              Set(R(2), 1),
              Instr(Opcode::kAdd, {R(0), R(0), R(2)}),
              Instr(Opcode::kJmp, {lang::Immediate{2}}),
          },
      .labels = {VLabel{.name = "END", .index = 6}},
      .loops = {LoopRegion{.begin = 2, .end = 5}},
      .num_vregs = 3,
  };
  auto intervals = ComputeLiveIntervals(program);
  EXPECT_EQ(IntervalOf(intervals, R(0)).end, 5U);
  EXPECT_EQ(IntervalOf(intervals, R(1)).end, 5U);
  // Defined and consumed inside one iteration.
  auto scratch = IntervalOf(intervals, R(2));
  EXPECT_EQ(scratch.start, 3U);
  EXPECT_EQ(scratch.end, 4U);

  auto assignment = AllocateRegisters(intervals, 16);
  ASSERT_TRUE(assignment.has_value()) << assignment.error().Message();
  EXPECT_TRUE(VerifyAssignment(intervals, *assignment).has_value());
  EXPECT_NE(assignment->at(R(2)), assignment->at(R(0)));
  EXPECT_NE(assignment->at(R(2)), assignment->at(R(1)));
}

TEST(RegisterAllocatorTest, ValueReadBeforeWrittenInLoopIsCarried) {
  // 0: bez v END        <- loop begin, reads last iteration's value
  // 1: set v 1
  // 2: set w 2
  // 3: jmp 0            <- loop end
  VProgram program{
      .instrs =
          {
              Instr(Opcode::kBez, {R(0), lang::LabelRef{"END"}}),
              Set(R(0), 1),
              Set(R(1), 2),
              Instr(Opcode::kJmp, {lang::Immediate{0}}),
          },
      .labels = {VLabel{.name = "END", .index = 4}},
      .loops = {LoopRegion{.begin = 0, .end = 3}},
      .num_vregs = 2,
  };
  auto intervals = ComputeLiveIntervals(program);
  auto carried = IntervalOf(intervals, R(0));
  EXPECT_EQ(carried.start, 0U);
  EXPECT_EQ(carried.end, 3U);

  auto assignment = AllocateRegisters(intervals, 16);
  ASSERT_TRUE(assignment.has_value()) << assignment.error().Message();
  EXPECT_NE(assignment->at(R(0)), assignment->at(R(1)));
}

TEST(RegisterAllocatorTest, OverlappingIntervalsNeverShareRegister) {
  std::vector<LiveInterval> intervals;
  for (uint32_t i = 0; i < 40; ++i) {
    uint32_t start = (i * 7) % 23;
    intervals.push_back(
        LiveInterval{.reg = R(i), .start = start, .end = start + (i % 5)});
  }
  std::ranges::sort(intervals, [](const auto& a, const auto& b) {
    return a.start < b.start || (a.start == b.start && a.reg.id < b.reg.id);
  });
  auto assignment = AllocateRegisters(intervals, 16);
  ASSERT_TRUE(assignment.has_value()) << assignment.error().Message();
  for (size_t i = 0; i < intervals.size(); ++i) {
    for (size_t j = i + 1; j < intervals.size(); ++j) {
      if (intervals[i].Overlaps(intervals[j])) {
        EXPECT_NE(
            assignment->at(intervals[i].reg), assignment->at(intervals[j].reg))
            << "v" << intervals[i].reg.id << " and v" << intervals[j].reg.id;
      }
    }
  }
  EXPECT_TRUE(VerifyAssignment(intervals, *assignment).has_value());
}

// Records a random program of arithmetic nested in if and loop blocks.
// Values are only used inside the block that defined them or below it.
class RandomProgram {
 public:
  RandomProgram(Builder& builder, uint32_t seed) : b_(builder), rng_(seed) {
  }

  void Generate() {
    std::vector<ValueId> pool;
    Block(0, pool);
    for (size_t i = 0; i < pool.size(); i += 2) {
      b_.ReturnValue(pool[i]);
    }
  }

 private:
  static constexpr int kMaxPool = 3;
  static constexpr int kMaxDepth = 3;

  auto Pick(int lo, int hi) -> int {
    return std::uniform_int_distribution<int>(lo, hi)(rng_);
  }

  auto Operand(const std::vector<ValueId>& pool) -> ValueOrConst {
    if (pool.empty() || Pick(0, 3) == 0) {
      return int32_t{Pick(-4, 9)};
    }
    return pool[static_cast<size_t>(Pick(0, static_cast<int>(pool.size()) - 1))];
  }

  void Keep(std::vector<ValueId>& pool, ValueId value) {
    if (pool.size() < static_cast<size_t>(kMaxPool)) {
      pool.push_back(value);
    } else {
      pool[static_cast<size_t>(Pick(0, kMaxPool - 1))] = value;
    }
  }

  void Block(int depth, std::vector<ValueId>& pool) {
    int statements = Pick(1, 5);
    for (int s = 0; s < statements; ++s) {
      int choice = Pick(0, depth < kMaxDepth ? 5 : 3);
      switch (choice) {
        case 0:
          Keep(pool, b_.Set(Pick(0, 20)));
          break;
        case 1:
          Keep(pool, b_.Add(Operand(pool), Operand(pool)));
          break;
        case 2:
          Keep(pool, b_.Sub(Operand(pool), Operand(pool)));
          break;
        case 3:
          Keep(pool, b_.Mul(Operand(pool), Operand(pool)));
          break;
        case 4: {
          ValueId lhs = pool.empty() ? b_.Set(1) : pool.front();
          b_.BeginIf(
              lhs, static_cast<CompareOp>(Pick(0, 3)), Operand(pool));
          std::vector<ValueId> then_pool = pool;
          Block(depth + 1, then_pool);
          if (Pick(0, 1) == 1) {
            ASSERT_TRUE(b_.BeginElse().has_value());
            std::vector<ValueId> else_pool = pool;
            Block(depth + 1, else_pool);
          }
          ASSERT_TRUE(b_.EndIf().has_value());
          break;
        }
        default: {
          std::vector<ValueId> inner = pool;
          Keep(inner, b_.BeginLoop(Pick(0, 3)));
          Block(depth + 1, inner);
          ASSERT_TRUE(b_.EndLoop().has_value());
          break;
        }
      }
    }
  }

  Builder& b_;
  std::mt19937 rng_;
};

TEST(RegisterAllocatorTest, LoweredProgramsNeverShareLiveRegisters) {
  const auto& flavour = flavour::Vanilla();
  int allocated = 0;
  for (uint32_t seed = 1; seed <= 200; ++seed) {
    Builder builder(flavour);
    RandomProgram(builder, seed).Generate();

    auto lowered = Lower(builder.PendingInput(), flavour);
    ASSERT_TRUE(lowered.has_value())
        << "seed " << seed << ": " << lowered.error().Message();
    auto intervals = ComputeLiveIntervals(lowered->program);
    auto assignment = AllocateRegisters(intervals, flavour.register_count);
    if (!assignment) {
      EXPECT_EQ(assignment.error().Kind(), DiagKind::kLayout) << "seed " << seed;
      continue;
    }
    ++allocated;

    EXPECT_TRUE(VerifyAssignment(intervals, *assignment).has_value())
        << "seed " << seed;
    for (size_t i = 0; i < intervals.size(); ++i) {
      for (size_t j = i + 1; j < intervals.size(); ++j) {
        if (intervals[i].Overlaps(intervals[j])) {
          EXPECT_NE(
              assignment->at(intervals[i].reg),
              assignment->at(intervals[j].reg))
              << "seed " << seed << ": v" << intervals[i].reg.id << " and v"
              << intervals[j].reg.id;
        }
      }
    }
    auto compiled = builder.Flush();
    EXPECT_TRUE(compiled.has_value())
        << "seed " << seed << ": " << compiled.error().Message();
  }
  EXPECT_GE(allocated, 100);
}

TEST(RegisterAllocatorTest, FullBankFits) {
  std::vector<LiveInterval> intervals;
  for (uint32_t i = 0; i < 16; ++i) {
    intervals.push_back(LiveInterval{.reg = R(i), .start = 0, .end = 10});
  }
  auto assignment = AllocateRegisters(intervals, 16);
  ASSERT_TRUE(assignment.has_value()) << assignment.error().Message();
  EXPECT_EQ(assignment->at(R(15)), Register::R(15));
}

TEST(RegisterAllocatorTest, ExhaustionIsLayoutError) {
  std::vector<LiveInterval> intervals;
  for (uint32_t i = 0; i < 17; ++i) {
    intervals.push_back(LiveInterval{.reg = R(i), .start = 0, .end = 10});
  }
  auto assignment = AllocateRegisters(intervals, 16);
  ASSERT_FALSE(assignment.has_value());
  EXPECT_EQ(assignment.error().Kind(), DiagKind::kLayout);
}

TEST(RegisterAllocatorTest, SmallerRegisterCountIsHonoured) {
  std::vector<LiveInterval> intervals = {
      LiveInterval{.reg = R(0), .start = 0, .end = 2},
      LiveInterval{.reg = R(1), .start = 1, .end = 2},
      LiveInterval{.reg = R(2), .start = 2, .end = 3},
  };
  auto assignment = AllocateRegisters(intervals, 2);
  ASSERT_FALSE(assignment.has_value());
  EXPECT_EQ(assignment.error().Kind(), DiagKind::kLayout);
}

TEST(RegisterAllocatorTest, VerifyRejectsSharedRegister) {
  std::vector<LiveInterval> intervals = {
      LiveInterval{.reg = R(0), .start = 0, .end = 3},
      LiveInterval{.reg = R(1), .start = 2, .end = 4},
  };
  RegisterAssignment assignment;
  assignment.emplace(R(0), Register::R(5));
  assignment.emplace(R(1), Register::R(5));
  auto verified = VerifyAssignment(intervals, assignment);
  ASSERT_FALSE(verified.has_value());
  EXPECT_EQ(verified.error().Kind(), DiagKind::kLayout);
}

}  // namespace
}  // namespace netqasm::compiler
