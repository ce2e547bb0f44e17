#include <gtest/gtest.h>

#include <cstdint>
#include <optional>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/compiler/future.hpp"
#include "netqasm/compiler/handle.hpp"
#include "netqasm/lang/operand.hpp"
#include "netqasm/vm/executor.hpp"

namespace netqasm::compiler {
namespace {

using lang::Register;

TEST(ResultStoreTest, UnknownFutureIsNotYetAvailable) {
  ResultStore store;
  auto value = store.Read(Future{.id = FutureId{3}});
  ASSERT_FALSE(value.has_value());
  EXPECT_EQ(value.error().Kind(), DiagKind::kNotYetAvailable);
}

TEST(ResultStoreTest, PendingFutureIsNotYetAvailable) {
  ResultStore store;
  store.AddPending(FutureId{0}, RegisterSlot{.reg = Register::M(0)});
  EXPECT_FALSE(store.IsResolved(FutureId{0}));
  auto value = store.Read(Future{.id = FutureId{0}});
  ASSERT_FALSE(value.has_value());
  EXPECT_EQ(value.error().Kind(), DiagKind::kNotYetAvailable);
}

TEST(ResultStoreTest, ResolvesRegistersAndArrays) {
  ResultStore store;
  store.AddPending(FutureId{0}, RegisterSlot{.reg = Register::M(2)});
  store.AddPending(FutureId{1}, ArraySlot{.address = 4});

  vm::ReturnedValues returned;
  returned.registers[Register::M(2)] = 1;
  returned.arrays[4] = {5, std::nullopt};
  auto resolved = store.Resolve({FutureId{0}, FutureId{1}}, returned);
  ASSERT_TRUE(resolved.has_value()) << resolved.error().Message();

  EXPECT_TRUE(store.IsResolved(FutureId{0}));
  auto value = store.Read(Future{.id = FutureId{0}});
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 1);

  ArrayFuture array{.id = FutureId{1}, .length = 2};
  auto values = store.ReadArray(array);
  ASSERT_TRUE(values.has_value());
  EXPECT_EQ(values->size(), 2U);

  auto entry = store.ReadEntry(array, 0);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(*entry, 5);
}

TEST(ResultStoreTest, UndefinedEntryIsExecutionError) {
  ResultStore store;
  store.AddPending(FutureId{0}, ArraySlot{.address = 0});
  vm::ReturnedValues returned;
  returned.arrays[0] = {std::nullopt};
  ASSERT_TRUE(store.Resolve({FutureId{0}}, returned).has_value());

  auto entry = store.ReadEntry(ArrayFuture{.id = FutureId{0}, .length = 1}, 0);
  ASSERT_FALSE(entry.has_value());
  EXPECT_EQ(entry.error().Kind(), DiagKind::kExecution);
}

TEST(ResultStoreTest, EntryOutsideArrayIsAddressError) {
  ResultStore store;
  store.AddPending(FutureId{0}, ArraySlot{.address = 0});
  vm::ReturnedValues returned;
  returned.arrays[0] = {1, 2};
  ASSERT_TRUE(store.Resolve({FutureId{0}}, returned).has_value());

  auto entry = store.ReadEntry(ArrayFuture{.id = FutureId{0}, .length = 2}, 2);
  ASSERT_FALSE(entry.has_value());
  EXPECT_EQ(entry.error().Kind(), DiagKind::kAddress);
}

TEST(ResultStoreTest, MissingReturnValueLeavesFuturePending) {
  ResultStore store;
  store.AddPending(FutureId{0}, RegisterSlot{.reg = Register::R(1)});
  auto resolved = store.Resolve({FutureId{0}}, vm::ReturnedValues{});
  ASSERT_FALSE(resolved.has_value());
  EXPECT_EQ(resolved.error().Kind(), DiagKind::kExecution);
  EXPECT_FALSE(store.IsResolved(FutureId{0}));
}

}  // namespace
}  // namespace netqasm::compiler
