#ifndef BONDCURVE_LOGARITHMIC_HPP
#define BONDCURVE_LOGARITHMIC_HPP

#include "curve.hpp"

namespace bondcurve {

// =============================================================================
// Logarithmic Curve
//
//   P(S) = c * ln(S + k)
//   F(x) = x * ln(x) - x
//   cost over [a, b] = c * (F(b + k) - F(a + k))
//
// k > 0 keeps the logarithm argument positive for every S >= 0.
// =============================================================================

class Logarithmic : public IntegralCurve {
public:
    // coefficient > 0, constant > 0
    Logarithmic(Fixed coefficient, Fixed constant, Fixed initial_supply = Fixed::zero());

    [[nodiscard]] CurveKind kind() const override { return CurveKind::Logarithmic; }
    [[nodiscard]] Fixed coefficient() const { return coefficient_; }
    [[nodiscard]] Fixed constant() const { return constant_; }

    [[nodiscard]] Fixed price_at(Fixed supply) const override;
    [[nodiscard]] Fixed integral(Fixed lo, Fixed hi) const override;

    [[nodiscard]] std::unique_ptr<BondingCurve> clone() const override;

private:
    Fixed coefficient_;
    Fixed constant_;
};

} // namespace bondcurve

#endif // BONDCURVE_LOGARITHMIC_HPP
