// include/portfolio_recon/reconcile/portfolio_summary.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "portfolio_recon/core/types.hpp"

namespace portfolio_recon {

/**
 * @brief Every derived quantity of one reconciliation run
 *
 * Produced fresh by AccountSnapshotComposer; no identity across runs.
 */
struct PortfolioSummary {
    // Cash flows from fills
    Money total_invested = 0.0;
    Money reinvested = 0.0;
    Money cash_invested = 0.0;

    // Settlement ledger
    Money realized_pnl = 0.0;
    Money return_rate = 0.0;
    Money cash_in = 0.0;
    Money cash_out = 0.0;
    CumulativeSeries cumulative_series;

    // Account level
    Money total_deposits = 0.0;
    Money net_profit = 0.0;
    Money net_profit_percent = 0.0;  // Fraction, e.g. 0.125
    Money unrealized_pnl = 0.0;

    AccountBalanceSnapshot account;

    /**
     * @brief Summary fields; cumulative_series as [{"ts": ..., "cumulative": ...}]
     */
    nlohmann::json to_json() const;

    /**
     * @brief Echoed account snapshot, in engine units and whole cents
     */
    nlohmann::json account_to_json() const;
};

/**
 * @brief Interchange envelope handed to the presentation layer
 */
struct SummaryReport {
    PortfolioSummary summary;
    std::string generated_at;  // ISO-8601 UTC, supplied by the caller
    int lookback_days = 0;
    std::optional<std::vector<Record>> fills;        // Raw records, echoed on request
    std::optional<std::vector<Record>> settlements;

    nlohmann::json to_json() const;
};

}  // namespace portfolio_recon
