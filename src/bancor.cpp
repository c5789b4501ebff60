// =============================================================================
// bancor.cpp - Reserve-ratio bonding curve
// =============================================================================

#include "bondcurve/bancor.hpp"
#include "bondcurve/fixed_math.hpp"

namespace bondcurve {

Bancor::Bancor(Fixed reserve, Fixed supply, Fixed connector_weight)
    : BondingCurve(CurveState{supply, reserve}),
      connector_weight_(connector_weight) {
    if (!connector_weight.is_positive() || connector_weight > Fixed::one()) {
        throw InvalidInput("Connector weight must be between 0 and 1");
    }
    if (reserve.is_negative() || supply.is_negative()) {
        throw InvalidInput("Reserve and supply must be non-negative");
    }
    // Both zero is an uninitialised pool
    if (supply.is_zero() && !reserve.is_zero()) {
        throw InvalidInput("Cannot have reserve with zero token supply");
    }
    if (reserve.is_zero() && !supply.is_zero()) {
        throw InvalidInput("Cannot have zero reserve with non-zero token supply");
    }
}

Fixed Bancor::get_price() const {
    if (state_.supply.is_zero()) return Fixed::zero();
    // R / S / w, dividing twice so a tiny S * w is never rounded to zero
    return reserve() / state_.supply / connector_weight_;
}

TradePlan Bancor::plan_buy(Fixed reserve_amount) const {
    if (reserve().is_zero()) {
        throw InvalidInput("Cannot buy with zero reserve: price undefined");
    }
    if (reserve_amount.is_zero()) return {Fixed::zero(), state_};

    // minted = S * ((1 + dR / R)^w - 1)
    Fixed growth = fx::pow(Fixed::one() + reserve_amount / reserve(), connector_weight_);
    Fixed minted = fx::max(state_.supply * (growth - Fixed::one()), Fixed::zero());

    return {minted, CurveState{state_.supply + minted, reserve() + reserve_amount}};
}

TradePlan Bancor::plan_sell(Fixed token_amount) const {
    if (token_amount.is_zero()) return {Fixed::zero(), state_};

    // returned = R * (1 - (1 - dS / S)^w)
    Fixed remaining = fx::pow(Fixed::one() - token_amount / state_.supply, connector_weight_);
    Fixed returned = reserve() * (Fixed::one() - remaining);
    returned = fx::min(fx::max(returned, Fixed::zero()), reserve());

    return {returned, CurveState{state_.supply - token_amount, reserve() - returned}};
}

std::unique_ptr<BondingCurve> Bancor::clone() const {
    return std::make_unique<Bancor>(*this);
}

} // namespace bondcurve
