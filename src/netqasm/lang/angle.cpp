#include "netqasm/lang/angle.hpp"

#include <cmath>
#include <cstdint>
#include <numbers>

#include "netqasm/common/internal_error.hpp"

namespace netqasm::lang {

namespace {

// Exponents come from validated instructions or from the builder, both of
// which bound them by kMaxDenomExp.
void CheckExponent(const char* where, uint8_t denom_exp) {
  if (denom_exp > Angle::kMaxDenomExp) {
    common::ThrowInternalError(where, "angle exponent above 7");
  }
}

// Number of steps of size pi / 2^d in a full turn.
auto FullTurn(uint8_t denom_exp) -> int64_t {
  return int64_t{2} << denom_exp;
}

auto Normalize(int64_t num, uint8_t denom_exp) -> int32_t {
  int64_t period = FullTurn(denom_exp);
  int64_t r = num % period;
  if (r < 0) {
    r += period;
  }
  return static_cast<int32_t>(r);
}

// Integer division by 2^shift with ties going to the even quotient.
auto ShiftRoundHalfEven(int64_t value, uint8_t shift) -> int64_t {
  if (shift == 0) {
    return value;
  }
  int64_t divisor = int64_t{1} << shift;
  int64_t quotient = value / divisor;
  int64_t remainder = value % divisor;
  if (remainder < 0) {
    remainder += divisor;
    quotient -= 1;
  }
  int64_t twice = remainder * 2;
  if (twice > divisor || (twice == divisor && (quotient & 1) != 0)) {
    quotient += 1;
  }
  return quotient;
}

}  // namespace

auto RoundHalfEven(double value) -> int64_t {
  double floor = std::floor(value);
  double diff = value - floor;
  auto lower = static_cast<int64_t>(floor);
  if (diff > 0.5) {
    return lower + 1;
  }
  if (diff < 0.5) {
    return lower;
  }
  return (lower % 2 == 0) ? lower : lower + 1;
}

auto Angle::Reduced() const -> Angle {
  CheckExponent("Angle::Reduced", denom_exp);
  int32_t n = Normalize(num, denom_exp);
  if (n == 0) {
    return Angle{.num = 0, .denom_exp = 0};
  }
  uint8_t d = denom_exp;
  while (d > 0 && (n % 2) == 0) {
    n /= 2;
    --d;
  }
  return Angle{.num = n, .denom_exp = d};
}

auto Angle::AtExponent(uint8_t target) const -> Angle {
  CheckExponent("Angle::AtExponent", denom_exp);
  CheckExponent("Angle::AtExponent", target);
  int64_t n = num;
  if (target >= denom_exp) {
    n <<= (target - denom_exp);
  } else {
    n = ShiftRoundHalfEven(n, static_cast<uint8_t>(denom_exp - target));
  }
  return Angle{.num = Normalize(n, target), .denom_exp = target};
}

auto Angle::Radians() const -> double {
  CheckExponent("Angle::Radians", denom_exp);
  return static_cast<double>(num) * std::numbers::pi /
         static_cast<double>(int64_t{1} << denom_exp);
}

auto AngleFromRadians(double radians, double tolerance) -> AngleApprox {
  constexpr double kTwoPi = 2.0 * std::numbers::pi;
  double turn = std::fmod(radians, kTwoPi);
  if (turn < 0.0) {
    turn += kTwoPi;
  }

  for (uint8_t d = 0; d <= Angle::kMaxDenomExp; ++d) {
    double step = std::numbers::pi / static_cast<double>(int64_t{1} << d);
    double x = turn / step;
    int64_t n = RoundHalfEven(x);
    if (std::abs(x - static_cast<double>(n)) * step <= tolerance) {
      Angle angle{.num = Normalize(n, d), .denom_exp = d};
      return AngleApprox{.angle = angle.Reduced(), .exact = true};
    }
  }

  constexpr uint8_t kFallback = Angle::kMaxDenomExp;
  double step = std::numbers::pi / static_cast<double>(int64_t{1} << kFallback);
  Angle angle{
      .num = Normalize(RoundHalfEven(turn / step), kFallback),
      .denom_exp = kFallback};
  return AngleApprox{.angle = angle.Reduced(), .exact = false};
}

}  // namespace netqasm::lang
