#ifndef BONDCURVE_LINEAR_HPP
#define BONDCURVE_LINEAR_HPP

#include "curve.hpp"

namespace bondcurve {

// =============================================================================
// Linear Curve
//
//   P(S) = k * S
//   cost over [a, b] = k * (b^2 - a^2) / 2
// =============================================================================

class Linear : public IntegralCurve {
public:
    // slope > 0
    explicit Linear(Fixed slope, Fixed initial_supply = Fixed::zero());

    [[nodiscard]] CurveKind kind() const override { return CurveKind::Linear; }
    [[nodiscard]] Fixed slope() const { return slope_; }

    [[nodiscard]] Fixed price_at(Fixed supply) const override;
    [[nodiscard]] Fixed integral(Fixed lo, Fixed hi) const override;

    [[nodiscard]] std::unique_ptr<BondingCurve> clone() const override;

private:
    Fixed slope_;
};

} // namespace bondcurve

#endif // BONDCURVE_LINEAR_HPP
