#include "netqasm/vm/app_memory.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <utility>

#include <fmt/core.h>

#include "netqasm/common/diagnostic/diagnostic.hpp"

namespace netqasm::vm {

namespace {

auto CheckIndex(int32_t address, int32_t index, size_t length) -> Result<void> {
  if (index < 0 || static_cast<size_t>(index) >= length) {
    return std::unexpected(
        Diagnostic::Address(
            UnknownSpan{},
            fmt::format(
                "index {} out of range for array @{} of length {}", index,
                address, length)));
  }
  return {};
}

}  // namespace

auto AppMemory::InitArray(int32_t address, int32_t length) -> Result<void> {
  if (length < 0) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format("negative length {} for array @{}", length, address)));
  }
  if (length > kMaxArrayLength) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format(
                "length {} for array @{} exceeds the limit of {} entries",
                length, address, kMaxArrayLength)));
  }
  size_t total = static_cast<size_t>(length);
  for (const auto& [other, values] : arrays_) {
    if (other != address) {
      total += values.size();
    }
  }
  if (total > kMaxTotalEntries) {
    return std::unexpected(
        Diagnostic::Execution(
            UnknownSpan{},
            fmt::format(
                "array @{} would bring application memory to {} entries, "
                "over the limit of {}",
                address, total, kMaxTotalEntries)));
  }
  arrays_[address] = ArrayValues(static_cast<size_t>(length));
  return {};
}

auto AppMemory::GetArray(int32_t address) const -> Result<const ArrayValues*> {
  auto it = arrays_.find(address);
  if (it == arrays_.end()) {
    return std::unexpected(
        Diagnostic::Address(
            UnknownSpan{}, fmt::format("no array at address @{}", address)));
  }
  return &it->second;
}

auto AppMemory::GetEntry(int32_t address, int32_t index) const
    -> Result<std::optional<int32_t>> {
  auto array = GetArray(address);
  if (!array) {
    return std::unexpected(std::move(array).error());
  }
  auto checked = CheckIndex(address, index, (*array)->size());
  if (!checked) {
    return std::unexpected(std::move(checked).error());
  }
  return (**array)[static_cast<size_t>(index)];
}

auto AppMemory::SetEntry(
    int32_t address, int32_t index, std::optional<int32_t> value)
    -> Result<void> {
  auto it = arrays_.find(address);
  if (it == arrays_.end()) {
    return std::unexpected(
        Diagnostic::Address(
            UnknownSpan{}, fmt::format("no array at address @{}", address)));
  }
  auto checked = CheckIndex(address, index, it->second.size());
  if (!checked) {
    return checked;
  }
  it->second[static_cast<size_t>(index)] = value;
  return {};
}

auto AppMemory::GetSlice(int32_t address, int32_t start, int32_t stop) const
    -> Result<ArrayValues> {
  auto array = GetArray(address);
  if (!array) {
    return std::unexpected(std::move(array).error());
  }
  const ArrayValues& values = **array;
  if (start < 0 || stop < start || static_cast<size_t>(stop) > values.size()) {
    return std::unexpected(
        Diagnostic::Address(
            UnknownSpan{},
            fmt::format(
                "slice [{}:{}] out of range for array @{} of length {}", start,
                stop, address, values.size())));
  }
  return ArrayValues(values.begin() + start, values.begin() + stop);
}

auto AppMemory::PhysicalQubit(int32_t virtual_id) const -> Result<int32_t> {
  auto it = qubits_.find(virtual_id);
  if (it == qubits_.end()) {
    return std::unexpected(
        Diagnostic::Address(
            UnknownSpan{},
            fmt::format("virtual qubit {} is not allocated", virtual_id)));
  }
  return it->second;
}

}  // namespace netqasm::vm
