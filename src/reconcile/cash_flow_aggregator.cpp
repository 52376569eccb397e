// src/reconcile/cash_flow_aggregator.cpp

#include "portfolio_recon/reconcile/cash_flow_aggregator.hpp"
#include <algorithm>
#include "portfolio_recon/core/logger.hpp"

namespace portfolio_recon {

CashFlowSummary CashFlowAggregator::aggregate(const std::vector<Fill>& fills) const {
    CashFlowSummary summary;
    Cents invested = 0;
    Cents generated = 0;

    for (const auto& fill : fills) {
        TRACE("Fill " << fill.contract_id << " " << action_to_string(fill.action) << " "
                      << fill.quantity << " @ " << fill.unit_price);
        switch (fill.action) {
            case Action::BUY:
                invested += to_cents(fill.notional());
                ++summary.buy_count;
                break;
            case Action::SELL:
                generated += to_cents(fill.notional());
                ++summary.sell_count;
                break;
            default:
                ++summary.ignored_count;
                break;
        }
    }

    const Cents reinvested = calculate_reinvested(invested, generated);
    summary.total_invested = from_cents(invested);
    summary.total_cash_generated = from_cents(generated);
    summary.reinvested = from_cents(reinvested);
    summary.cash_invested = from_cents(invested - reinvested);

    DEBUG("Aggregated " << fills.size() << " fills: " << summary.buy_count << " buys, "
                        << summary.sell_count << " sells, " << summary.ignored_count
                        << " unrecognized; invested=" << summary.total_invested
                        << " generated=" << summary.total_cash_generated);
    return summary;
}

Cents CashFlowAggregator::calculate_reinvested(Cents total_invested, Cents total_cash_generated) {
    return std::min(total_invested, total_cash_generated);
}

}  // namespace portfolio_recon
