// =============================================================================
// curve.cpp - BondingCurve trade flow and IntegralCurve
// =============================================================================

#include "bondcurve/curve.hpp"
#include "bondcurve/log.hpp"

namespace bondcurve {

std::optional<CurveKind> parse_curve_kind(std::string_view name) {
    for (CurveKind kind : {CurveKind::Linear, CurveKind::Exponential, CurveKind::Logarithmic,
                           CurveKind::Sigmoid, CurveKind::Bancor}) {
        if (name == to_string(kind)) return kind;
    }
    return std::nullopt;
}

// =============================================================================
// Trade Flow
// =============================================================================

TradePlan BondingCurve::checked_buy(Fixed amount) const {
    if (amount.is_negative()) {
        throw InvalidInput("Amount must be non-negative");
    }
    return plan_buy(amount);
}

TradePlan BondingCurve::checked_sell(Fixed amount) const {
    if (amount.is_negative()) {
        throw InvalidInput("Amount must be non-negative");
    }
    if (amount > state_.supply) {
        throw InvalidInput("Invalid token amount: exceeds current supply");
    }
    return plan_sell(amount);
}

Fixed BondingCurve::buy_token(Fixed amount) {
    TradePlan plan = checked_buy(amount);

    auto logger = log::logger();
    if (logger->should_log(spdlog::level::debug)) {
        logger->debug("{} buy amount={} value={} supply={}", name(), amount.to_string(),
                      plan.value.to_string(), plan.after.supply.to_string());
    }

    state_ = plan.after;
    return plan.value;
}

Fixed BondingCurve::sell_token(Fixed amount) {
    TradePlan plan = checked_sell(amount);

    auto logger = log::logger();
    if (logger->should_log(spdlog::level::debug)) {
        logger->debug("{} sell amount={} value={} supply={}", name(), amount.to_string(),
                      plan.value.to_string(), plan.after.supply.to_string());
    }

    state_ = plan.after;
    return plan.value;
}

Fixed BondingCurve::quote_buy(Fixed amount) const {
    return checked_buy(amount).value;
}

Fixed BondingCurve::quote_sell(Fixed amount) const {
    return checked_sell(amount).value;
}

// =============================================================================
// IntegralCurve
// =============================================================================

IntegralCurve::IntegralCurve(Fixed initial_supply)
    : BondingCurve(CurveState{initial_supply, std::nullopt}) {
    if (initial_supply.is_negative()) {
        throw InvalidInput("Initial supply must be non-negative");
    }
}

TradePlan IntegralCurve::plan_buy(Fixed amount) const {
    if (amount.is_zero()) return {Fixed::zero(), state_};

    // Cost = integral of P over [S, S + amount]
    Fixed new_supply = state_.supply + amount;
    Fixed cost = integral(state_.supply, new_supply);
    return {cost, CurveState{new_supply, std::nullopt}};
}

TradePlan IntegralCurve::plan_sell(Fixed amount) const {
    if (amount.is_zero()) return {Fixed::zero(), state_};

    // Refund = integral of P over [S - amount, S]
    Fixed new_supply = state_.supply - amount;
    Fixed refund = integral(new_supply, state_.supply);
    return {refund, CurveState{new_supply, std::nullopt}};
}

} // namespace bondcurve
