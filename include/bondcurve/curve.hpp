#ifndef BONDCURVE_CURVE_HPP
#define BONDCURVE_CURVE_HPP

#include <memory>
#include <optional>
#include <string_view>

#include "types.hpp"
#include "error.hpp"

namespace bondcurve {

// =============================================================================
// Curve Kind
// =============================================================================

enum class CurveKind : uint8_t {
    Linear = 0,
    Exponential = 1,
    Logarithmic = 2,
    Sigmoid = 3,
    Bancor = 4
};

inline constexpr const char* to_string(CurveKind kind) {
    switch (kind) {
        case CurveKind::Linear: return "linear";
        case CurveKind::Exponential: return "exponential";
        case CurveKind::Logarithmic: return "logarithmic";
        case CurveKind::Sigmoid: return "sigmoid";
        case CurveKind::Bancor: return "bancor";
    }
    return "unknown";
}

std::optional<CurveKind> parse_curve_kind(std::string_view name);

// =============================================================================
// Curve State
// =============================================================================

struct CurveState {
    Fixed supply;                  // Circulating token supply, >= 0
    std::optional<Fixed> reserve;  // Reserve balance (Bancor only), >= 0
};

// Result of pricing a trade against a state, before anything is committed
struct TradePlan {
    Fixed value;       // Cost, refund, tokens minted or reserve returned
    CurveState after;  // State once the trade is applied
};

// =============================================================================
// BondingCurve - Pricing Interface
// =============================================================================

class BondingCurve {
public:
    virtual ~BondingCurve() = default;

    [[nodiscard]] virtual CurveKind kind() const = 0;
    [[nodiscard]] const char* name() const { return to_string(kind()); }

    // Spot price at the current state
    [[nodiscard]] virtual Fixed get_price() const = 0;

    // Buy: token quantity for integral curves, reserve deposit for Bancor.
    // Returns the cost (integral curves) or tokens minted (Bancor).
    Fixed buy_token(Fixed amount);

    // Sell a token quantity. Returns the refund or reserve paid out.
    Fixed sell_token(Fixed amount);

    // Same values buy_token / sell_token would return, without mutating
    [[nodiscard]] Fixed quote_buy(Fixed amount) const;
    [[nodiscard]] Fixed quote_sell(Fixed amount) const;

    [[nodiscard]] Fixed get_supply() const { return state_.supply; }
    [[nodiscard]] std::optional<Fixed> get_reserve() const { return state_.reserve; }
    [[nodiscard]] const CurveState& state() const { return state_; }

    [[nodiscard]] virtual std::unique_ptr<BondingCurve> clone() const = 0;

protected:
    explicit BondingCurve(CurveState state) : state_(state) {}
    BondingCurve(const BondingCurve&) = default;
    BondingCurve& operator=(const BondingCurve&) = default;

    // Price a validated trade. Must not touch state_.
    virtual TradePlan plan_buy(Fixed amount) const = 0;
    virtual TradePlan plan_sell(Fixed amount) const = 0;

    CurveState state_;

private:
    TradePlan checked_buy(Fixed amount) const;
    TradePlan checked_sell(Fixed amount) const;
};

// =============================================================================
// IntegralCurve - price function integrated over a supply interval
// =============================================================================

class IntegralCurve : public BondingCurve {
public:
    [[nodiscard]] Fixed get_price() const override { return price_at(state_.supply); }

    // P(s) for any s >= 0
    [[nodiscard]] virtual Fixed price_at(Fixed supply) const = 0;

    // Integral of P over [lo, hi], 0 <= lo <= hi
    [[nodiscard]] virtual Fixed integral(Fixed lo, Fixed hi) const = 0;

protected:
    explicit IntegralCurve(Fixed initial_supply);

    TradePlan plan_buy(Fixed amount) const override;
    TradePlan plan_sell(Fixed amount) const override;
};

} // namespace bondcurve

#endif // BONDCURVE_CURVE_HPP
