#ifndef BONDCURVE_EXPONENTIAL_HPP
#define BONDCURVE_EXPONENTIAL_HPP

#include "curve.hpp"

namespace bondcurve {

// =============================================================================
// Exponential (power) Curve
//
//   P(S) = c * S^n
//   cost over [a, b] = c * (b^(n+1) - a^(n+1)) / (n + 1)
// =============================================================================

class Exponential : public IntegralCurve {
public:
    // coefficient > 0, exponent >= 0
    Exponential(Fixed coefficient, Fixed exponent, Fixed initial_supply = Fixed::zero());

    [[nodiscard]] CurveKind kind() const override { return CurveKind::Exponential; }
    [[nodiscard]] Fixed coefficient() const { return coefficient_; }
    [[nodiscard]] Fixed exponent() const { return exponent_; }

    [[nodiscard]] Fixed price_at(Fixed supply) const override;
    [[nodiscard]] Fixed integral(Fixed lo, Fixed hi) const override;

    [[nodiscard]] std::unique_ptr<BondingCurve> clone() const override;

private:
    Fixed coefficient_;
    Fixed exponent_;
    Fixed n_plus_one_;
};

} // namespace bondcurve

#endif // BONDCURVE_EXPONENTIAL_HPP
