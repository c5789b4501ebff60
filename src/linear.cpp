// =============================================================================
// linear.cpp - Linear bonding curve
// =============================================================================

#include "bondcurve/linear.hpp"
#include "bondcurve/fixed_math.hpp"

namespace bondcurve {

Linear::Linear(Fixed slope, Fixed initial_supply)
    : IntegralCurve(initial_supply), slope_(slope) {
    if (!slope.is_positive()) {
        throw InvalidInput("Slope must be positive");
    }
}

Fixed Linear::price_at(Fixed supply) const {
    return slope_ * supply;
}

Fixed Linear::integral(Fixed lo, Fixed hi) const {
    // k * (hi - lo) * (hi + lo) / 2, one 256-bit step for the product
    Fixed width_cost = slope_ * (hi - lo);
    return Fixed::from_raw(fx::mul_div(width_cost.raw(), (hi + lo).raw(), 2 * X18_ONE));
}

std::unique_ptr<BondingCurve> Linear::clone() const {
    return std::make_unique<Linear>(*this);
}

} // namespace bondcurve
