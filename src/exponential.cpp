// =============================================================================
// exponential.cpp - Power-law bonding curve
// =============================================================================

#include "bondcurve/exponential.hpp"
#include "bondcurve/fixed_math.hpp"

namespace bondcurve {

Exponential::Exponential(Fixed coefficient, Fixed exponent, Fixed initial_supply)
    : IntegralCurve(initial_supply),
      coefficient_(coefficient),
      exponent_(exponent) {
    if (!coefficient.is_positive() || exponent.is_negative()) {
        throw InvalidInput("Coefficient must be positive and exponent non-negative");
    }
    n_plus_one_ = exponent_ + Fixed::one();
}

Fixed Exponential::price_at(Fixed supply) const {
    return coefficient_ * fx::pow(supply, exponent_);
}

Fixed Exponential::integral(Fixed lo, Fixed hi) const {
    // c * s^(n+1) is taken as (c * s) * s^n so a small coefficient scales
    // the term down before the power grows it. pow(0, n) never goes through ln.
    Fixed upper = (coefficient_ * hi) * fx::pow(hi, exponent_);
    Fixed lower = (coefficient_ * lo) * fx::pow(lo, exponent_);
    return (upper - lower) / n_plus_one_;
}

std::unique_ptr<BondingCurve> Exponential::clone() const {
    return std::make_unique<Exponential>(*this);
}

} // namespace bondcurve
