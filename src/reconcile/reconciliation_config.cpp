// src/reconcile/reconciliation_config.cpp

#include "portfolio_recon/reconcile/reconciliation_config.hpp"
#include <cmath>
#include "portfolio_recon/core/env_loader.hpp"
#include "portfolio_recon/core/logger.hpp"

namespace portfolio_recon {

namespace {

nlohmann::json money_fields_to_json(const std::vector<MoneyField>& fields) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& field : fields) {
        out.push_back({{"name", field.name}, {"scale", field.scale}});
    }
    return out;
}

// Entries are either {"name": ..., "scale": ...} or a bare field name with scale 1
std::vector<MoneyField> money_fields_from_json(const nlohmann::json& j) {
    std::vector<MoneyField> fields;
    for (const auto& entry : j) {
        if (entry.is_string()) {
            fields.push_back({entry.get<std::string>(), 1.0});
        } else {
            MoneyField field;
            field.name = entry.at("name").get<std::string>();
            if (entry.contains("scale"))
                field.scale = entry.at("scale").get<double>();
            fields.push_back(field);
        }
    }
    return fields;
}

}  // namespace

nlohmann::json RecordSchema::to_json() const {
    nlohmann::json j;
    j["timestamp_fields"] = timestamp_fields;
    j["contract_fields"] = contract_fields;
    j["action_fields"] = action_fields;
    j["quantity_fields"] = quantity_fields;
    j["price_fields"] = money_fields_to_json(price_fields);
    j["cash_change_fields"] = money_fields_to_json(cash_change_fields);
    j["balance_cash_fields"] = money_fields_to_json(balance_cash_fields);
    j["portfolio_value_fields"] = money_fields_to_json(portfolio_value_fields);
    j["balance_updated_fields"] = balance_updated_fields;
    j["exposure_fields"] = money_fields_to_json(exposure_fields);
    return j;
}

void RecordSchema::from_json(const nlohmann::json& j) {
    if (j.contains("timestamp_fields"))
        timestamp_fields = j.at("timestamp_fields").get<std::vector<std::string>>();
    if (j.contains("contract_fields"))
        contract_fields = j.at("contract_fields").get<std::vector<std::string>>();
    if (j.contains("action_fields"))
        action_fields = j.at("action_fields").get<std::vector<std::string>>();
    if (j.contains("quantity_fields"))
        quantity_fields = j.at("quantity_fields").get<std::vector<std::string>>();
    if (j.contains("price_fields"))
        price_fields = money_fields_from_json(j.at("price_fields"));
    if (j.contains("cash_change_fields"))
        cash_change_fields = money_fields_from_json(j.at("cash_change_fields"));
    if (j.contains("balance_cash_fields"))
        balance_cash_fields = money_fields_from_json(j.at("balance_cash_fields"));
    if (j.contains("portfolio_value_fields"))
        portfolio_value_fields = money_fields_from_json(j.at("portfolio_value_fields"));
    if (j.contains("balance_updated_fields"))
        balance_updated_fields = j.at("balance_updated_fields").get<std::vector<std::string>>();
    if (j.contains("exposure_fields"))
        exposure_fields = money_fields_from_json(j.at("exposure_fields"));
}

nlohmann::json ReconciliationConfig::to_json() const {
    nlohmann::json j;
    j["total_deposits"] = total_deposits;
    j["lookback_days"] = lookback_days;
    j["allow_balance_fallback"] = allow_balance_fallback;
    j["include_raw_records"] = include_raw_records;
    j["schema"] = schema.to_json();
    return j;
}

void ReconciliationConfig::from_json(const nlohmann::json& j) {
    if (j.contains("total_deposits"))
        total_deposits = j.at("total_deposits").get<double>();
    if (j.contains("lookback_days"))
        lookback_days = j.at("lookback_days").get<int>();
    if (j.contains("allow_balance_fallback"))
        allow_balance_fallback = j.at("allow_balance_fallback").get<bool>();
    if (j.contains("include_raw_records"))
        include_raw_records = j.at("include_raw_records").get<bool>();
    if (j.contains("schema"))
        schema.from_json(j.at("schema"));
}

void ReconciliationConfig::apply_env_overrides() {
    if (auto raw = EnvLoader::get("TOTAL_DEPOSITS")) {
        auto parsed = FieldExtractor::to_number(nlohmann::json(*raw));
        if (parsed) {
            total_deposits = *parsed;
        } else {
            WARN("Ignoring unparsable TOTAL_DEPOSITS='" << *raw << "', keeping "
                                                         << total_deposits);
        }
    }

    if (auto raw = EnvLoader::get("LOOKBACK_DAYS")) {
        auto parsed = FieldExtractor::to_number(nlohmann::json(*raw));
        if (parsed && *parsed >= 1.0 && *parsed <= 36500.0 && std::floor(*parsed) == *parsed) {
            lookback_days = static_cast<int>(*parsed);
        } else {
            WARN("Ignoring unparsable LOOKBACK_DAYS='" << *raw << "', keeping " << lookback_days);
        }
    }
}

Result<void> ReconciliationConfig::validate() const {
    // Non-positive deposits are allowed; net_profit_percent then reports 0
    if (!std::isfinite(total_deposits)) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "total_deposits must be a finite amount, got " +
                                    std::to_string(total_deposits),
                                "ReconciliationConfig");
    }
    if (lookback_days <= 0) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "lookback_days must be positive, got " +
                                    std::to_string(lookback_days),
                                "ReconciliationConfig");
    }
    if (schema.timestamp_fields.empty() || schema.cash_change_fields.empty() ||
        schema.price_fields.empty() || schema.quantity_fields.empty() ||
        schema.action_fields.empty()) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "record schema is missing a required candidate list",
                                "ReconciliationConfig");
    }
    return Result<void>();
}

}  // namespace portfolio_recon
