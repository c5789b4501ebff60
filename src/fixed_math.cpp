// =============================================================================
// fixed_math.cpp - Checked X18 arithmetic and transcendentals
// Deterministic integer-only implementation (no libm on any path)
// =============================================================================

#include "bondcurve/fixed_math.hpp"

namespace bondcurve {
namespace fx {

// =============================================================================
// Internal Constants
// =============================================================================

namespace {

// Internal precision for ln/exp: 1e36
constexpr I128 X36_ONE = X18_ONE * X18_ONE;

// ln(2) * 1e36 = 0.693147180559945309417232121458176568...
constexpr I128 LN2_X36 =
    static_cast<I128>(693147180559945309LL) * X18_ONE + 417232121458176568LL;

inline U128 magnitude(I128 x) {
    return x < 0 ? U128(0) - static_cast<U128>(x) : static_cast<U128>(x);
}

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

// Restoring long division of U256 by U128.
// Requires num.hi < denom so the quotient fits in 128 bits.
inline U128 div_u256_u128(U256 num, U128 denom, U128& rem) {
    U128 r = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (r >> 127) != 0;
        r = (r << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || r >= denom) {
            r -= denom;  // Wraps correctly when carry is set
            quot |= 1;
        }
    }
    rem = r;
    return quot;
}

// =============================================================================
// 1e36 Kernels
// =============================================================================

// ln(x) scaled by 1e36, for raw X18 x > 0
I128 ln_x36(I128 x) {
    // Range reduce: x = m * 2^k with m in [1, 2)
    int k = 0;
    I128 m;
    if (x >= X18_ONE) {
        while (k < 67 && x >= (X18_ONE << (k + 1))) ++k;
        m = mul_div(x, X36_ONE, X18_ONE << k);
    } else {
        int s = 0;
        while ((x << s) < X18_ONE) ++s;
        k = -s;
        m = mul_div(x, X18_ONE << s, 1);
    }

    // ln(m) = 2 * atanh(z), z = (m - 1) / (m + 1) in [0, 1/3)
    I128 z = mul_div(m - X36_ONE, X36_ONE, m + X36_ONE);
    I128 z2 = mul_div(z, z, X36_ONE);
    I128 sum = 0;
    I128 term = z;
    for (int j = 1; term != 0; j += 2) {
        sum += term / j;
        term = mul_div(term, z2, X36_ONE);
    }

    return 2 * sum + static_cast<I128>(k) * LN2_X36;
}

// e^x for x scaled by 1e36, result in X18
Fixed exp_x36(I128 x) {
    if (x > EXP_MAX_INPUT * X18_ONE) {
        throw CalculationError("Exponential argument exceeds representable range");
    }
    if (x < EXP_MIN_INPUT * X18_ONE) return Fixed::zero();

    // x = k * ln2 + r, |r| <= ln2 / 2
    I128 k = x / LN2_X36;
    I128 r = x - k * LN2_X36;
    const I128 half_ln2 = LN2_X36 / 2;
    if (r > half_ln2) {
        ++k;
        r -= LN2_X36;
    } else if (r < -half_ln2) {
        --k;
        r += LN2_X36;
    }

    // Taylor series for e^r
    I128 sum = X36_ONE;
    I128 term = X36_ONE;
    for (int i = 1; term != 0; ++i) {
        term = mul_div(term, r, X36_ONE) / i;
        sum += term;
    }

    // Scale by 2^k and drop to X18
    I128 raw = k >= 0
        ? mul_div(sum, I128(1) << static_cast<int>(k), X18_ONE, Rounding::HalfAwayFromZero)
        : mul_div(sum, 1, X18_ONE << static_cast<int>(-k), Rounding::HalfAwayFromZero);
    return Fixed::from_raw(raw);
}

Fixed pow_int(Fixed base, I128 n) {
    bool invert = n < 0;
    U128 e = magnitude(n);
    Fixed result = Fixed::one();
    Fixed acc = base;
    while (e != 0) {
        if (e & 1) result = mul(result, acc);
        e >>= 1;
        if (e != 0) acc = mul(acc, acc);
    }
    return invert ? div(Fixed::one(), result) : result;
}

} // anonymous namespace

// =============================================================================
// Arithmetic
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom, Rounding rounding) {
    if (denom == 0) throw CalculationError("Division by zero");
    if (a == 0 || b == 0) return 0;

    bool neg = ((a < 0) != (b < 0)) != (denom < 0);
    U128 ud = magnitude(denom);

    U256 product = mul_u128(magnitude(a), magnitude(b));
    if (product.hi >= ud) throw CalculationError("Arithmetic overflow in mul_div");

    U128 rem = 0;
    U128 quot = div_u256_u128(product, ud, rem);
    if (quot > static_cast<U128>(I128_MAX)) {
        throw CalculationError("Arithmetic overflow in mul_div");
    }
    if (rounding == Rounding::HalfAwayFromZero && rem >= ud - rem) {
        ++quot;
        if (quot > static_cast<U128>(I128_MAX)) {
            throw CalculationError("Arithmetic overflow in mul_div");
        }
    }

    I128 result = static_cast<I128>(quot);
    return neg ? -result : result;
}

Fixed add(Fixed a, Fixed b) {
    I128 r = 0;
    if (__builtin_add_overflow(a.raw(), b.raw(), &r) || r < I128_MIN) {
        throw CalculationError("Addition overflow");
    }
    return Fixed::from_raw(r);
}

Fixed sub(Fixed a, Fixed b) {
    I128 r = 0;
    if (__builtin_sub_overflow(a.raw(), b.raw(), &r) || r < I128_MIN) {
        throw CalculationError("Subtraction overflow");
    }
    return Fixed::from_raw(r);
}

Fixed mul(Fixed a, Fixed b) {
    return Fixed::from_raw(mul_div(a.raw(), b.raw(), X18_ONE));
}

Fixed div(Fixed a, Fixed b) {
    if (b.is_zero()) throw CalculationError("Division by zero");
    return Fixed::from_raw(mul_div(a.raw(), X18_ONE, b.raw()));
}

// =============================================================================
// Transcendentals
// =============================================================================

Fixed ln(Fixed x) {
    if (!x.is_positive()) {
        throw CalculationError("Cannot take logarithm of non-positive number");
    }
    return Fixed::from_raw(mul_div(ln_x36(x.raw()), 1, X18_ONE, Rounding::HalfAwayFromZero));
}

Fixed exp(Fixed x) {
    if (x.raw() > EXP_MAX_INPUT) {
        throw CalculationError("Exponential argument exceeds representable range");
    }
    if (x.raw() < EXP_MIN_INPUT) return Fixed::zero();
    return exp_x36(x.raw() * X18_ONE);
}

Fixed pow(Fixed base, Fixed exponent) {
    if (exponent.is_zero()) return Fixed::one();
    if (exponent.is_integer()) return pow_int(base, exponent.raw() / X18_ONE);

    if (base.is_negative()) {
        throw CalculationError("Cannot raise negative number to fractional power");
    }
    if (base.is_zero()) {
        // 0^e stays off the ln path
        if (exponent.is_negative()) {
            throw CalculationError("Division by zero: zero raised to negative power");
        }
        return Fixed::zero();
    }
    if (exponent == Fixed::half()) return sqrt(base);

    return exp_x36(mul_div(exponent.raw(), ln_x36(base.raw()), X18_ONE));
}

Fixed sqrt(Fixed x) {
    if (x.is_negative()) {
        throw CalculationError("Cannot take square root of negative number");
    }
    if (x.is_zero()) return Fixed::zero();

    // Newton-Raphson on floor(sqrt(x * 1e18)), starting above the root
    I128 y = x.raw() / 2 + X18_HALF;
    while (true) {
        I128 z = (mul_div(x.raw(), X18_ONE, y) + y) / 2;
        if (z >= y) break;
        y = z;
    }
    return Fixed::from_raw(y);
}

} // namespace fx
} // namespace bondcurve
