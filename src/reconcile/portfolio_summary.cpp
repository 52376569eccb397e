// src/reconcile/portfolio_summary.cpp

#include "portfolio_recon/reconcile/portfolio_summary.hpp"

namespace portfolio_recon {

nlohmann::json PortfolioSummary::to_json() const {
    nlohmann::json series = nlohmann::json::array();
    for (const auto& point : cumulative_series) {
        series.push_back({{"ts", point.ts_ms}, {"cumulative", point.cumulative}});
    }

    nlohmann::json j;
    j["total_invested"] = total_invested;
    j["reinvested"] = reinvested;
    j["cash_invested"] = cash_invested;
    j["realized_pnl"] = realized_pnl;
    j["return_rate"] = return_rate;
    j["cash_in"] = cash_in;
    j["cash_out"] = cash_out;
    j["cumulative_series"] = series;
    j["total_deposits"] = total_deposits;
    j["net_profit"] = net_profit;
    j["net_profit_percent"] = net_profit_percent;
    j["unrealized_pnl"] = unrealized_pnl;
    return j;
}

nlohmann::json PortfolioSummary::account_to_json() const {
    nlohmann::json j;
    j["cash_cents"] = to_cents(account.cash_amount);
    j["positions_cents"] = to_cents(account.open_position_value);
    j["cash"] = account.cash_amount;
    j["positions_value"] = account.open_position_value;
    j["portfolio_total"] = account.portfolio_total();
    j["updated_ts"] = account.updated_ts ? nlohmann::json(*account.updated_ts) : nlohmann::json();
    j["exposure_source"] = exposure_source_to_string(account.exposure_source);
    return j;
}

nlohmann::json SummaryReport::to_json() const {
    nlohmann::json j;
    j["generated_at"] = generated_at;
    j["lookback_days"] = lookback_days;
    j["account"] = summary.account_to_json();
    if (fills) {
        j["fills_last_n_days"] = *fills;
    }
    if (settlements) {
        j["settlements_last_n_days"] = *settlements;
    }
    j["summary"] = summary.to_json();
    return j;
}

}  // namespace portfolio_recon
