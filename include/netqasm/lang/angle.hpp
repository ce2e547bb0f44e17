#pragma once

#include <cstdint>

namespace netqasm::lang {

// Discrete rotation angle num * pi / 2^denom_exp.
//
// Both fields travel as uint8 immediates. A canonical angle keeps
// num in [0, 2^(denom_exp + 1)) so that it names a point on [0, 2pi).
struct Angle {
  static constexpr uint8_t kMaxDenomExp = 7;

  int32_t num = 0;
  uint8_t denom_exp = 0;

  auto operator==(const Angle&) const -> bool = default;

  // Normalizes num into range and reduces to lowest terms. A zero angle
  // reduces to (0, 0).
  [[nodiscard]] auto Reduced() const -> Angle;

  // Re-expresses the angle with the given exponent. Dropping precision rounds
  // half to even; the result is normalized into range.
  [[nodiscard]] auto AtExponent(uint8_t denom_exp) const -> Angle;

  [[nodiscard]] auto Radians() const -> double;
};

// Result of approximating a real-valued angle.
struct AngleApprox {
  Angle angle;
  bool exact = true;  // False when no exponent <= 7 met the tolerance
};

// Finds the smallest exponent d <= 7 whose nearest multiple of pi / 2^d lies
// within `tolerance` radians, then reduces. Falls back to d = 7 when none
// qualifies.
auto AngleFromRadians(double radians, double tolerance) -> AngleApprox;

// Round to nearest integer, ties to even.
auto RoundHalfEven(double value) -> int64_t;

}  // namespace netqasm::lang
