#ifndef BONDCURVE_SIGMOID_HPP
#define BONDCURVE_SIGMOID_HPP

#include "curve.hpp"

namespace bondcurve {

// =============================================================================
// Sigmoid Curve
//
//   P(S) = M / (1 + e^(-k(S - m)))
//   cost over [a, b] = (M / k) * (ln(1 + e^(k*b)) - ln(1 + e^(k*a)))
//
// M = max_price, k = steepness, m = midpoint.
//
// The midpoint shapes the price but not the cost, which is evaluated at k*S
// directly. Trades therefore fail with CalculationError once k * supply
// passes fx::EXP_MAX_INPUT (46.5), wherever m lies; the usable supply is
// about 46.5 / k.
// =============================================================================

class Sigmoid : public IntegralCurve {
public:
    // max_price > 0, steepness > 0, midpoint unrestricted
    Sigmoid(Fixed max_price, Fixed steepness, Fixed midpoint,
            Fixed initial_supply = Fixed::zero());

    [[nodiscard]] CurveKind kind() const override { return CurveKind::Sigmoid; }
    [[nodiscard]] Fixed max_price() const { return max_price_; }
    [[nodiscard]] Fixed steepness() const { return steepness_; }
    [[nodiscard]] Fixed midpoint() const { return midpoint_; }

    // Always strictly inside (0, max_price)
    [[nodiscard]] Fixed price_at(Fixed supply) const override;

    // Throws CalculationError when k * hi leaves the exp() domain
    [[nodiscard]] Fixed integral(Fixed lo, Fixed hi) const override;

    [[nodiscard]] std::unique_ptr<BondingCurve> clone() const override;

private:
    Fixed softplus(Fixed supply) const;

    Fixed max_price_;
    Fixed steepness_;
    Fixed midpoint_;
};

} // namespace bondcurve

#endif // BONDCURVE_SIGMOID_HPP
