#pragma once

#include <cstdint>
#include <utility>

namespace netqasm::compiler {

// Application-side qubit handle. Stable across flushes; the virtual id it
// maps to is chosen by the builder at allocation time.
struct QubitId {
  uint32_t value = 0;

  auto operator==(const QubitId&) const -> bool = default;
  auto operator<=>(const QubitId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, QubitId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr QubitId kInvalidQubitId{UINT32_MAX};

// Classical value produced inside one flush.
struct ValueId {
  uint32_t value = 0;

  auto operator==(const ValueId&) const -> bool = default;
  auto operator<=>(const ValueId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ValueId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ValueId kInvalidValueId{UINT32_MAX};

// Array created inside one flush. Addresses are assigned at compile time.
struct ArrayId {
  uint32_t value = 0;

  auto operator==(const ArrayId&) const -> bool = default;
  auto operator<=>(const ArrayId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, ArrayId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr ArrayId kInvalidArrayId{UINT32_MAX};

struct FutureId {
  uint32_t value = 0;

  auto operator==(const FutureId&) const -> bool = default;
  auto operator<=>(const FutureId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }

  template <typename H>
  friend auto AbslHashValue(H h, FutureId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

constexpr FutureId kInvalidFutureId{UINT32_MAX};

}  // namespace netqasm::compiler
