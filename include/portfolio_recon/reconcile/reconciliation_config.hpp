// include/portfolio_recon/reconcile/reconciliation_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "portfolio_recon/core/config_base.hpp"
#include "portfolio_recon/core/error.hpp"
#include "portfolio_recon/reconcile/field_extractor.hpp"

namespace portfolio_recon {

/**
 * @brief Ordered candidate field names for every logical value the engine reads
 *
 * This is the only place that knows the upstream field names. Money candidates carry
 * the scale converting them into the engine unit (dollars by default).
 */
struct RecordSchema {
    std::vector<std::string> timestamp_fields{"time", "ts", "created_time", "created_ts",
                                              "settled_time"};
    std::vector<std::string> contract_fields{"ticker", "market_ticker", "event_ticker"};

    // Fills
    std::vector<std::string> action_fields{"action"};
    std::vector<std::string> quantity_fields{"size", "count"};
    std::vector<MoneyField> price_fields{{"price", 1.0}};

    // Settlements
    std::vector<MoneyField> cash_change_fields{{"cash_change", 1.0}, {"cashChange", 1.0}};

    // Balance record (cents upstream)
    std::vector<MoneyField> balance_cash_fields{{"balance", 0.01}};
    std::vector<MoneyField> portfolio_value_fields{{"portfolio_value", 0.01}};
    std::vector<std::string> balance_updated_fields{"updated_ts"};

    // Open position records, first present wins per record
    std::vector<MoneyField> exposure_fields{{"event_exposure_dollars", 1.0},
                                            {"total_cost_dollars", 1.0}};

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Configuration of one reconciliation run
 */
struct ReconciliationConfig : public ConfigBase {
    double total_deposits{40.0};              // Externally supplied, not derivable from the API
    int lookback_days{365};                   // Activity window ending at run time
    bool allow_balance_fallback{true};        // Permit portfolio-minus-cash exposure
    bool include_raw_records{false};          // Echo raw records in the report envelope
    RecordSchema schema;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Override settings from TOTAL_DEPOSITS and LOOKBACK_DAYS
     *
     * An unparsable value keeps the current setting and logs a warning.
     */
    void apply_env_overrides();

    /**
     * @brief Check the configuration before a run
     * @return INVALID_CONFIG error describing the first violation
     */
    Result<void> validate() const;
};

}  // namespace portfolio_recon
