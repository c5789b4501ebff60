#ifndef BONDCURVE_BONDCURVE_HPP
#define BONDCURVE_BONDCURVE_HPP

// =============================================================================
// Bondcurve - Deterministic Bonding Curve Pricing
//
// Curves:
//   Linear       P = m * S
//   Exponential  P = a * S^n
//   Logarithmic  P = a * ln(S + k)
//   Sigmoid      P = M / (1 + e^(-k(S - m)))
//   Bancor       P = R / (S * w)
//
// All quantities are X18 fixed point (see types.hpp).
// =============================================================================

#include "types.hpp"
#include "error.hpp"
#include "fixed_math.hpp"
#include "log.hpp"
#include "curve.hpp"
#include "linear.hpp"
#include "exponential.hpp"
#include "logarithmic.hpp"
#include "sigmoid.hpp"
#include "bancor.hpp"
#include "config.hpp"

#endif // BONDCURVE_BONDCURVE_HPP
