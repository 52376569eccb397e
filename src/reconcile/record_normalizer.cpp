// src/reconcile/record_normalizer.cpp

#include "portfolio_recon/reconcile/record_normalizer.hpp"
#include "portfolio_recon/reconcile/field_extractor.hpp"
#include "portfolio_recon/reconcile/timestamp_normalizer.hpp"

namespace portfolio_recon {

RecordNormalizer::RecordNormalizer(RecordSchema schema) : schema_(std::move(schema)) {}

Fill RecordNormalizer::to_fill(const Record& record) const {
    Fill fill;
    fill.contract_id =
        FieldExtractor::extract_text(record, schema_.contract_fields).value_or("");

    auto action_text = FieldExtractor::extract_text(record, schema_.action_fields);
    fill.action = action_text ? FieldExtractor::parse_action(*action_text) : Action::UNKNOWN;

    fill.quantity = FieldExtractor::extract_quantity(record, schema_.quantity_fields).value_or(0);

    // Negative prices are a data artifact, not a credit
    Money price = FieldExtractor::extract_money(record, schema_.price_fields).value_or(0.0);
    fill.unit_price = price > 0.0 ? price : 0.0;

    fill.occurred_at_ms = TimestampNormalizer::resolve(record, schema_.timestamp_fields);
    return fill;
}

Settlement RecordNormalizer::to_settlement(const Record& record) const {
    Settlement settlement;
    settlement.contract_id =
        FieldExtractor::extract_text(record, schema_.contract_fields).value_or("");
    settlement.cash_change = FieldExtractor::extract_money(record, schema_.cash_change_fields);
    settlement.occurred_at_ms = TimestampNormalizer::resolve(record, schema_.timestamp_fields);
    return settlement;
}

std::vector<Fill> RecordNormalizer::to_fills(const std::vector<Record>& records) const {
    std::vector<Fill> fills;
    fills.reserve(records.size());
    for (const auto& record : records) {
        fills.push_back(to_fill(record));
    }
    return fills;
}

std::vector<Settlement> RecordNormalizer::to_settlements(
    const std::vector<Record>& records) const {
    std::vector<Settlement> settlements;
    settlements.reserve(records.size());
    for (const auto& record : records) {
        settlements.push_back(to_settlement(record));
    }
    return settlements;
}

}  // namespace portfolio_recon
