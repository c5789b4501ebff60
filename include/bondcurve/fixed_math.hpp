#ifndef BONDCURVE_FIXED_MATH_HPP
#define BONDCURVE_FIXED_MATH_HPP

#include "types.hpp"
#include "error.hpp"

namespace bondcurve {

// =============================================================================
// Checked X18 Primitives
//
// Every function either returns the exactly rounded result or throws
// CalculationError. Transcendentals run at 1e36 internal precision with
// 256-bit intermediates, so results are identical on every platform.
// =============================================================================

namespace fx {

enum class Rounding : uint8_t {
    TowardZero = 0,
    HalfAwayFromZero = 1
};

// Largest exp() argument whose result is representable (~e^46.5 = 1.6e20)
constexpr I128 EXP_MAX_INPUT = 46 * X18_ONE + X18_HALF;
// Below this exp() rounds to zero (e^-42 < 1e-18)
constexpr I128 EXP_MIN_INPUT = -42 * X18_ONE;

Fixed add(Fixed a, Fixed b);
Fixed sub(Fixed a, Fixed b);
Fixed mul(Fixed a, Fixed b);
Fixed div(Fixed a, Fixed b);

// a * b / denom on raw values with a 256-bit intermediate
I128 mul_div(I128 a, I128 b, I128 denom, Rounding rounding = Rounding::TowardZero);

// Natural logarithm, x > 0
Fixed ln(Fixed x);

// e^x, x <= EXP_MAX_INPUT
Fixed exp(Fixed x);

// base^exponent. Integer exponents use repeated multiplication; fractional
// exponents require base >= 0 and go through exp(e * ln(base)).
Fixed pow(Fixed base, Fixed exponent);

// Square root, x >= 0, truncated to the raw unit
Fixed sqrt(Fixed x);

inline Fixed abs(Fixed x) { return x.is_negative() ? -x : x; }
inline Fixed min(Fixed a, Fixed b) { return b < a ? b : a; }
inline Fixed max(Fixed a, Fixed b) { return a < b ? b : a; }

} // namespace fx

} // namespace bondcurve

#endif // BONDCURVE_FIXED_MATH_HPP
