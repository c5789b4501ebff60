// =============================================================================
// logarithmic.cpp - Logarithmic bonding curve
// =============================================================================

#include "bondcurve/logarithmic.hpp"
#include "bondcurve/fixed_math.hpp"

namespace bondcurve {

namespace {

// Antiderivative of ln(x): x * ln(x) - x
Fixed x_ln_x_minus_x(Fixed x) {
    return x * fx::ln(x) - x;
}

} // anonymous namespace

Logarithmic::Logarithmic(Fixed coefficient, Fixed constant, Fixed initial_supply)
    : IntegralCurve(initial_supply),
      coefficient_(coefficient),
      constant_(constant) {
    if (!coefficient.is_positive() || !constant.is_positive()) {
        throw InvalidInput("Coefficient and constant must be positive");
    }
}

Fixed Logarithmic::price_at(Fixed supply) const {
    return coefficient_ * fx::ln(supply + constant_);
}

Fixed Logarithmic::integral(Fixed lo, Fixed hi) const {
    Fixed s_old = lo + constant_;
    Fixed s_new = hi + constant_;
    return coefficient_ * (x_ln_x_minus_x(s_new) - x_ln_x_minus_x(s_old));
}

std::unique_ptr<BondingCurve> Logarithmic::clone() const {
    return std::make_unique<Logarithmic>(*this);
}

} // namespace bondcurve
