// src/reconcile/account_snapshot_composer.cpp

#include "portfolio_recon/reconcile/account_snapshot_composer.hpp"
#include "portfolio_recon/core/logger.hpp"

namespace portfolio_recon {

PortfolioSummary AccountSnapshotComposer::compose(const AccountBalanceSnapshot& snapshot,
                                                  const CashFlowSummary& cash_flow,
                                                  const LedgerSummary& ledger,
                                                  Money total_deposits) const {
    const Money net_profit = calculate_net_profit(snapshot.portfolio_total(), total_deposits);

    PortfolioSummary summary;
    summary.total_invested = cash_flow.total_invested;
    summary.reinvested = cash_flow.reinvested;
    summary.cash_invested = cash_flow.cash_invested;
    summary.realized_pnl = ledger.realized_pnl;
    summary.return_rate = ledger.return_rate;
    summary.cash_in = ledger.cash_in;
    summary.cash_out = ledger.cash_out;
    summary.cumulative_series = ledger.cumulative_series;
    summary.total_deposits = total_deposits;
    summary.net_profit = net_profit;
    summary.net_profit_percent = calculate_net_profit_percent(net_profit, total_deposits);
    summary.unrealized_pnl =
        calculate_unrealized_pnl(snapshot.open_position_value, net_profit, ledger.realized_pnl);
    summary.account = snapshot;

    DEBUG("Composed summary: portfolio_total=" << snapshot.portfolio_total()
                                               << " net_profit=" << summary.net_profit
                                               << " realized=" << summary.realized_pnl
                                               << " unrealized=" << summary.unrealized_pnl);
    return summary;
}

Money AccountSnapshotComposer::calculate_net_profit(Money portfolio_total, Money total_deposits) {
    return portfolio_total - total_deposits;
}

Money AccountSnapshotComposer::calculate_net_profit_percent(Money net_profit,
                                                            Money total_deposits) {
    if (total_deposits <= 0.0) {
        return 0.0;
    }
    return net_profit / total_deposits;
}

Money AccountSnapshotComposer::calculate_unrealized_pnl(Money open_position_value,
                                                        Money net_profit, Money realized_pnl) {
    if (open_position_value <= kNoOpenPositionEpsilon) {
        return 0.0;
    }
    return net_profit - realized_pnl;
}

}  // namespace portfolio_recon
