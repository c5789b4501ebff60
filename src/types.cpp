// =============================================================================
// types.cpp - Fixed value type: conversions and checked operators
// =============================================================================

#include "bondcurve/types.hpp"
#include "bondcurve/fixed_math.hpp"

#include <cmath>

namespace bondcurve {

namespace {

// Largest double whose X18 scaling still fits in I128 (2^127 ~ 1.7014e38)
constexpr double MAX_SCALED_DOUBLE = 1.7e38;

std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    return out;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

// =============================================================================
// Conversions
// =============================================================================

Fixed Fixed::from_double(double v) {
    if (!std::isfinite(v)) {
        throw InvalidInput("Value must be finite");
    }
    const double scaled = std::round(v * static_cast<double>(X18_ONE));
    if (std::fabs(scaled) >= MAX_SCALED_DOUBLE) {
        throw InvalidInput("Value out of fixed-point range");
    }
    return Fixed(static_cast<I128>(scaled));
}

Fixed Fixed::from_string(std::string_view s) {
    const std::string text{s};
    size_t pos = 0;
    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = (s[0] == '-');
        pos = 1;
    }

    // Integer part
    I128 int_part = 0;
    int digits = 0;
    for (; pos < s.size() && s[pos] != '.'; ++pos) {
        if (!is_digit(s[pos])) {
            throw InvalidInput("Malformed number: '" + text + "'");
        }
        int_part = int_part * 10 + (s[pos] - '0');
        if (int_part > I128_MAX / X18_ONE) {
            throw InvalidInput("Number out of fixed-point range: '" + text + "'");
        }
        ++digits;
    }

    // Fractional part, truncated to X18_DECIMALS digits
    I128 frac = 0;
    int frac_digits = 0;
    if (pos < s.size()) {
        ++pos;  // '.'
        for (; pos < s.size(); ++pos) {
            if (!is_digit(s[pos])) {
                throw InvalidInput("Malformed number: '" + text + "'");
            }
            if (frac_digits < X18_DECIMALS) {
                frac = frac * 10 + (s[pos] - '0');
                ++frac_digits;
            }
            ++digits;
        }
    }
    if (digits == 0) {
        throw InvalidInput("Malformed number: '" + text + "'");
    }
    for (; frac_digits < X18_DECIMALS; ++frac_digits) frac *= 10;

    I128 raw = 0;
    if (__builtin_add_overflow(int_part * X18_ONE, frac, &raw)) {
        throw InvalidInput("Number out of fixed-point range: '" + text + "'");
    }
    return Fixed(negative ? -raw : raw);
}

double Fixed::to_double() const {
    return static_cast<double>(raw_) / static_cast<double>(X18_ONE);
}

std::string Fixed::to_string() const {
    U128 abs_val = raw_ < 0 ? U128(0) - static_cast<U128>(raw_) : static_cast<U128>(raw_);
    U128 int_part = abs_val / static_cast<U128>(X18_ONE);
    U128 frac_part = abs_val % static_cast<U128>(X18_ONE);

    std::string result = raw_ < 0 ? "-" : "";
    result += u128_to_string(int_part);
    if (frac_part == 0) return result;

    // Fractional part with leading zeros, trailing zeros trimmed
    std::string frac_str = u128_to_string(frac_part);
    frac_str.insert(0, X18_DECIMALS - frac_str.size(), '0');
    frac_str.erase(frac_str.find_last_not_of('0') + 1);
    return result + "." + frac_str;
}

// =============================================================================
// Checked Operators
// =============================================================================

Fixed Fixed::operator+(Fixed rhs) const { return fx::add(*this, rhs); }
Fixed Fixed::operator-(Fixed rhs) const { return fx::sub(*this, rhs); }
Fixed Fixed::operator*(Fixed rhs) const { return fx::mul(*this, rhs); }
Fixed Fixed::operator/(Fixed rhs) const { return fx::div(*this, rhs); }

} // namespace bondcurve
