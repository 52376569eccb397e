// include/portfolio_recon/reconcile/account_snapshot_composer.hpp
#pragma once

#include "portfolio_recon/core/types.hpp"
#include "portfolio_recon/reconcile/cash_flow_aggregator.hpp"
#include "portfolio_recon/reconcile/portfolio_summary.hpp"
#include "portfolio_recon/reconcile/settlement_ledger.hpp"

namespace portfolio_recon {

/**
 * @brief Open exposure at or below this amount means no open positions
 */
constexpr double kNoOpenPositionEpsilon = 1e-6;

/**
 * @brief Merges the account snapshot with cash-flow and ledger output
 *
 * Pure calculation component: no state, no I/O.
 */
class AccountSnapshotComposer {
public:
    AccountSnapshotComposer() = default;

    /**
     * @brief Build the portfolio summary
     * @param snapshot Point-in-time balance and exposure
     * @param cash_flow Output of CashFlowAggregator
     * @param ledger Output of SettlementLedger
     * @param total_deposits Externally supplied deposit total
     * @return Fully populated summary
     */
    PortfolioSummary compose(const AccountBalanceSnapshot& snapshot,
                             const CashFlowSummary& cash_flow, const LedgerSummary& ledger,
                             Money total_deposits) const;

    static Money calculate_net_profit(Money portfolio_total, Money total_deposits);

    /**
     * @brief net_profit / total_deposits, or 0 when nothing was deposited
     */
    static Money calculate_net_profit_percent(Money net_profit, Money total_deposits);

    /**
     * @brief net_profit - realized_pnl, forced to 0 when no capital is at risk
     *
     * With no open positions all profit reads as realized, whatever residue the
     * balance arithmetic leaves behind.
     */
    static Money calculate_unrealized_pnl(Money open_position_value, Money net_profit,
                                          Money realized_pnl);
};

}  // namespace portfolio_recon
