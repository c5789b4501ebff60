#ifndef BONDCURVE_TYPES_HPP
#define BONDCURVE_TYPES_HPP

#include "error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace bondcurve {

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;   // 1e18
constexpr I128 X18_HALF = 500000000000000000LL;   // 0.5e18
constexpr int X18_DECIMALS = 18;

constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);
// Symmetric range so that negation never overflows
constexpr I128 I128_MIN = -I128_MAX;

// Signed X18 quantity. Construction from text or double is range checked;
// arithmetic operators are checked and throw CalculationError.
class Fixed {
public:
    constexpr Fixed() : raw_(0) {}

    // Raw values below I128_MIN are rejected so negation stays defined
    static constexpr Fixed from_raw(I128 raw) {
        if (raw < I128_MIN) {
            throw InvalidInput("Raw value below fixed-point range");
        }
        return Fixed(raw);
    }
    static Fixed from_int(int64_t v) {
        return Fixed(static_cast<I128>(v) * X18_ONE);
    }
    // Rounds to the nearest raw unit; throws InvalidInput on NaN, inf or overflow
    static Fixed from_double(double v);
    // Exact decimal parse ("-12.5", "0.000001"); digits past 18 are truncated
    static Fixed from_string(std::string_view s);

    static constexpr Fixed zero() { return Fixed(0); }
    static constexpr Fixed one() { return Fixed(X18_ONE); }
    static constexpr Fixed half() { return Fixed(X18_HALF); }
    static constexpr Fixed epsilon() { return Fixed(1); }
    static constexpr Fixed max() { return Fixed(I128_MAX); }
    static constexpr Fixed min() { return Fixed(I128_MIN); }

    [[nodiscard]] constexpr I128 raw() const { return raw_; }
    [[nodiscard]] double to_double() const;
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_zero() const { return raw_ == 0; }
    [[nodiscard]] constexpr bool is_positive() const { return raw_ > 0; }
    [[nodiscard]] constexpr bool is_negative() const { return raw_ < 0; }
    [[nodiscard]] constexpr bool is_integer() const { return raw_ % X18_ONE == 0; }

    // Checked arithmetic (see fixed_math.hpp)
    Fixed operator+(Fixed rhs) const;
    Fixed operator-(Fixed rhs) const;
    Fixed operator*(Fixed rhs) const;
    Fixed operator/(Fixed rhs) const;
    Fixed operator-() const { return Fixed(-raw_); }

    Fixed& operator+=(Fixed rhs) { return *this = *this + rhs; }
    Fixed& operator-=(Fixed rhs) { return *this = *this - rhs; }
    Fixed& operator*=(Fixed rhs) { return *this = *this * rhs; }
    Fixed& operator/=(Fixed rhs) { return *this = *this / rhs; }

    constexpr bool operator==(Fixed rhs) const { return raw_ == rhs.raw_; }
    constexpr bool operator!=(Fixed rhs) const { return raw_ != rhs.raw_; }
    constexpr bool operator<(Fixed rhs) const { return raw_ < rhs.raw_; }
    constexpr bool operator<=(Fixed rhs) const { return raw_ <= rhs.raw_; }
    constexpr bool operator>(Fixed rhs) const { return raw_ > rhs.raw_; }
    constexpr bool operator>=(Fixed rhs) const { return raw_ >= rhs.raw_; }

private:
    constexpr explicit Fixed(I128 raw) : raw_(raw) {}

    I128 raw_;
};

} // namespace bondcurve

#endif // BONDCURVE_TYPES_HPP
