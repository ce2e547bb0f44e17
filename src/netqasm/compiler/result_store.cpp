#include <cstddef>
#include <cstdint>
#include <expected>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"
#include "netqasm/common/internal_error.hpp"
#include "netqasm/common/overloaded.hpp"
#include "netqasm/compiler/future.hpp"
#include "netqasm/lang/operand.hpp"

namespace netqasm::compiler {

void ResultStore::AddPending(FutureId id, FutureSlot slot) {
  if (!states_.try_emplace(id, Pending{.slot = slot}).second) {
    common::ThrowInternalError(
        "ResultStore::AddPending",
        fmt::format("future {} registered twice", id.value));
  }
}

auto ResultStore::Resolve(
    const std::vector<FutureId>& ids, const vm::ReturnedValues& returned)
    -> Result<void> {
  for (auto id : ids) {
    auto it = states_.find(id);
    if (it == states_.end()) {
      common::ThrowInternalError(
          "ResultStore::Resolve",
          fmt::format("future {} was never registered", id.value));
    }
    auto& state = it->second;
    const auto* pending = std::get_if<Pending>(&state);
    if (pending == nullptr) {
      common::ThrowInternalError(
          "ResultStore::Resolve",
          fmt::format("future {} resolved twice", id.value));
    }
    auto value = std::visit(
        Overloaded{
            [&](const RegisterSlot& slot)
                -> Result<std::variant<int32_t, vm::ArrayValues>> {
              auto found = returned.registers.find(slot.reg);
              if (found == returned.registers.end()) {
                return std::unexpected(
                    Diagnostic::Execution(
                        UnknownSpan{},
                        fmt::format(
                            "subroutine did not return register {}",
                            lang::ToString(slot.reg))));
              }
              return found->second;
            },
            [&](const ArraySlot& slot)
                -> Result<std::variant<int32_t, vm::ArrayValues>> {
              auto found = returned.arrays.find(slot.address);
              if (found == returned.arrays.end()) {
                return std::unexpected(
                    Diagnostic::Execution(
                        UnknownSpan{},
                        fmt::format(
                            "subroutine did not return array @{}",
                            slot.address)));
              }
              return found->second;
            },
        },
        pending->slot);
    if (!value) {
      return std::unexpected(std::move(value).error());
    }
    state = Resolved{.value = std::move(*value)};
  }
  return {};
}

auto ResultStore::Find(FutureId id) const -> Result<const Resolved*> {
  auto it = states_.find(id);
  if (it == states_.end()) {
    return std::unexpected(
        Diagnostic::NotYetAvailable(
            fmt::format("future {} has not been flushed yet", id.value)));
  }
  const auto* resolved = std::get_if<Resolved>(&it->second);
  if (resolved == nullptr) {
    return std::unexpected(
        Diagnostic::NotYetAvailable(
            fmt::format("future {} is still pending", id.value)));
  }
  return resolved;
}

auto ResultStore::Read(Future future) const -> Result<int32_t> {
  auto resolved = Find(future.id);
  if (!resolved) {
    return std::unexpected(std::move(resolved).error());
  }
  const auto* value = std::get_if<int32_t>(&(*resolved)->value);
  if (value == nullptr) {
    common::ThrowInternalError(
        "ResultStore::Read",
        fmt::format("future {} holds an array", future.id.value));
  }
  return *value;
}

auto ResultStore::ReadArray(ArrayFuture future) const
    -> Result<vm::ArrayValues> {
  auto resolved = Find(future.id);
  if (!resolved) {
    return std::unexpected(std::move(resolved).error());
  }
  const auto* values = std::get_if<vm::ArrayValues>(&(*resolved)->value);
  if (values == nullptr) {
    common::ThrowInternalError(
        "ResultStore::ReadArray",
        fmt::format("future {} holds a single value", future.id.value));
  }
  return *values;
}

auto ResultStore::ReadEntry(ArrayFuture future, int32_t index) const
    -> Result<int32_t> {
  auto values = ReadArray(future);
  if (!values) {
    return std::unexpected(std::move(values).error());
  }
  if (index < 0 || static_cast<size_t>(index) >= values->size()) {
    return std::unexpected(
        Diagnostic::Address(
            UnknownSpan{},
            fmt::format(
                "index {} outside array future of length {}", index,
                values->size())));
  }
  const auto& entry = (*values)[static_cast<size_t>(index)];
  if (!entry) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format("entry {} of the array future is undefined", index)));
  }
  return *entry;
}

auto ResultStore::IsResolved(FutureId id) const -> bool {
  auto it = states_.find(id);
  return it != states_.end() && std::holds_alternative<Resolved>(it->second);
}

}  // namespace netqasm::compiler
