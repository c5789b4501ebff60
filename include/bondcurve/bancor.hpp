#ifndef BONDCURVE_BANCOR_HPP
#define BONDCURVE_BANCOR_HPP

#include "curve.hpp"

namespace bondcurve {

// =============================================================================
// Bancor Curve (reserve ratio)
//
//   P = R / (S * w)
//   buy(dR):  minted   = S * ((1 + dR / R)^w - 1)
//   sell(dS): returned = R * (1 - (1 - dS / S)^w)
//
// R = reserve balance, S = token supply, w = connector weight in (0, 1].
// =============================================================================

class Bancor : public BondingCurve {
public:
    // Reserve and supply are both zero (uninitialised pool) or both positive
    Bancor(Fixed reserve, Fixed supply, Fixed connector_weight);

    [[nodiscard]] CurveKind kind() const override { return CurveKind::Bancor; }
    [[nodiscard]] Fixed connector_weight() const { return connector_weight_; }

    // Zero while the supply is zero
    [[nodiscard]] Fixed get_price() const override;

    [[nodiscard]] std::unique_ptr<BondingCurve> clone() const override;

protected:
    TradePlan plan_buy(Fixed reserve_amount) const override;
    TradePlan plan_sell(Fixed token_amount) const override;

private:
    Fixed reserve() const { return *state_.reserve; }

    Fixed connector_weight_;
};

} // namespace bondcurve

#endif // BONDCURVE_BANCOR_HPP
