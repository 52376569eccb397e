// include/portfolio_recon/reconcile/settlement_ledger.hpp
// Realized P&L and the cumulative profit curve, derived from settlements

#pragma once

#include <cstddef>
#include <vector>
#include "portfolio_recon/core/types.hpp"

namespace portfolio_recon {

/**
 * @brief Scalar totals and time series produced by the ledger
 */
struct LedgerSummary {
    Money realized_pnl = 0.0;
    Money cash_in = 0.0;   // Sum of credits
    Money cash_out = 0.0;  // Sum of debit magnitudes
    Money return_rate = 0.0;

    // Non-decreasing in ts_ms; each point is realized_pnl at that settlement
    CumulativeSeries cumulative_series;

    size_t settled_count = 0;
    size_t skipped_count = 0;        // No cash change
    size_t untimestamped_count = 0;  // Counted in totals, absent from the series
};

class SettlementLedger {
public:
    SettlementLedger() = default;

    /**
     * @brief Walk settlements in time order and accumulate realized P&L
     *
     * Settlements without a timestamp are moved behind all timestamped ones,
     * keeping their relative order, so they contribute to the totals without
     * disturbing the curve. Amounts are accumulated in whole cents, so the
     * totals do not depend on input order.
     *
     * @param settlements Settlements in any order
     * @param total_invested Capital deployed, used for the return rate
     * @return Ledger totals and cumulative series
     */
    LedgerSummary reconcile(const std::vector<Settlement>& settlements,
                            Money total_invested) const;

    /**
     * @brief realized_pnl / total_invested, or 0 when nothing was invested
     */
    static Money calculate_return_rate(Money realized_pnl, Money total_invested);

    /**
     * @brief Stable time ordering with untimestamped settlements last
     */
    static std::vector<Settlement> sort_by_time(const std::vector<Settlement>& settlements);
};

}  // namespace portfolio_recon
