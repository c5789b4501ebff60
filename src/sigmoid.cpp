// =============================================================================
// sigmoid.cpp - Logistic bonding curve
// =============================================================================

#include "bondcurve/sigmoid.hpp"
#include "bondcurve/fixed_math.hpp"

namespace bondcurve {

namespace {

constexpr Fixed EXP_LIMIT = Fixed::from_raw(fx::EXP_MAX_INPUT);

} // anonymous namespace

Sigmoid::Sigmoid(Fixed max_price, Fixed steepness, Fixed midpoint, Fixed initial_supply)
    : IntegralCurve(initial_supply),
      max_price_(max_price),
      steepness_(steepness),
      midpoint_(midpoint) {
    if (!max_price.is_positive() || !steepness.is_positive()) {
        throw InvalidInput("Invalid parameters: max_price and steepness must be positive");
    }
}

Fixed Sigmoid::price_at(Fixed supply) const {
    // Exponent -k(S - m), saturated: the price is flat that far from m
    Fixed distance = supply - midpoint_;
    Fixed t;
    if (fx::abs(distance) > EXP_LIMIT / steepness_) {
        t = distance.is_negative() ? EXP_LIMIT : -EXP_LIMIT;
    } else {
        t = -(steepness_ * distance);
    }

    Fixed price = max_price_ / (Fixed::one() + fx::exp(t));

    // Keep the result inside the open interval after rounding
    if (price >= max_price_) price = max_price_ - Fixed::epsilon();
    if (!price.is_positive()) price = Fixed::epsilon();
    return price;
}

Fixed Sigmoid::softplus(Fixed supply) const {
    // ln(1 + e^(k*S)); out-of-range exponents fail instead of saturating
    Fixed x = steepness_ * supply;
    if (x > EXP_LIMIT) {
        throw CalculationError("Sigmoid exponent exceeds representable range");
    }
    return fx::ln(Fixed::one() + fx::exp(x));
}

Fixed Sigmoid::integral(Fixed lo, Fixed hi) const {
    Fixed diff = softplus(hi) - softplus(lo);
    return max_price_ * diff / steepness_;
}

std::unique_ptr<BondingCurve> Sigmoid::clone() const {
    return std::make_unique<Sigmoid>(*this);
}

} // namespace bondcurve
