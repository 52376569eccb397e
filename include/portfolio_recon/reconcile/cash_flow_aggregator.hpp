// include/portfolio_recon/reconcile/cash_flow_aggregator.hpp
// Capital deployed versus capital returned, derived from fills

#pragma once

#include <cstddef>
#include <vector>
#include "portfolio_recon/core/types.hpp"

namespace portfolio_recon {

/**
 * @brief Cash-flow decomposition of a fill history
 *
 * Invariants: reinvested <= total_invested, reinvested <= total_cash_generated,
 * cash_invested = total_invested - reinvested >= 0
 *
 * Notionals are summed in whole cents, so the totals do not depend on fill order.
 */
struct CashFlowSummary {
    Money total_invested = 0.0;        // Notional of BUY fills
    Money total_cash_generated = 0.0;  // Notional of SELL fills
    Money reinvested = 0.0;            // Buying funded by prior selling
    Money cash_invested = 0.0;         // Net new capital committed

    size_t buy_count = 0;
    size_t sell_count = 0;
    size_t ignored_count = 0;  // Action::UNKNOWN
};

class CashFlowAggregator {
public:
    CashFlowAggregator() = default;

    /**
     * @brief Classify every fill and derive invested/reinvested figures
     * @param fills Fills in any order
     * @return Aggregated cash flows
     */
    CashFlowSummary aggregate(const std::vector<Fill>& fills) const;

    /**
     * @brief Portion of buying funded by selling, never exceeding either side
     */
    static Cents calculate_reinvested(Cents total_invested, Cents total_cash_generated);
};

}  // namespace portfolio_recon
