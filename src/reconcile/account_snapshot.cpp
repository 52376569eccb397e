// src/reconcile/account_snapshot.cpp

#include "portfolio_recon/reconcile/account_snapshot.hpp"
#include <algorithm>
#include "portfolio_recon/core/logger.hpp"
#include "portfolio_recon/reconcile/field_extractor.hpp"
#include "portfolio_recon/reconcile/timestamp_normalizer.hpp"

namespace portfolio_recon {

AccountSnapshotBuilder::AccountSnapshotBuilder(const ReconciliationConfig& config)
    : schema_(config.schema),
      allow_balance_fallback_(config.allow_balance_fallback) {}

std::optional<Money> AccountSnapshotBuilder::summed_exposure(
    const std::vector<Record>& positions) const {
    std::optional<Cents> total;
    for (const auto& position : positions) {
        auto exposure = FieldExtractor::extract_money(position, schema_.exposure_fields);
        if (!exposure) {
            continue;
        }
        total = total.value_or(0) + to_cents(*exposure);
    }
    if (!total) {
        return std::nullopt;
    }
    return from_cents(*total);
}

AccountBalanceSnapshot AccountSnapshotBuilder::build(const Record& balance,
                                                     const std::vector<Record>& positions) const {
    AccountBalanceSnapshot snapshot;

    Money cash = FieldExtractor::extract_money(balance, schema_.balance_cash_fields).value_or(0.0);
    if (cash < 0.0) {
        WARN("Balance record reports negative cash " << cash << ", flooring at zero");
        cash = 0.0;
    }
    snapshot.cash_amount = cash;
    snapshot.updated_ts = TimestampNormalizer::resolve(balance, schema_.balance_updated_fields);

    Money exposure = 0.0;
    if (auto summed = summed_exposure(positions)) {
        exposure = *summed;
        snapshot.exposure_source = ExposureSource::SUMMED_EXPOSURE;
    } else if (positions.empty() && allow_balance_fallback_) {
        auto portfolio_value =
            FieldExtractor::extract_money(balance, schema_.portfolio_value_fields);
        if (portfolio_value) {
            exposure = from_cents(to_cents(*portfolio_value) - to_cents(cash));
            snapshot.exposure_source = ExposureSource::PORTFOLIO_MINUS_CASH;
            WARN("No position records; open exposure derived as portfolio value minus cash ("
                 << *portfolio_value << " - " << cash << " = " << exposure << ")");
        }
    } else if (!positions.empty()) {
        WARN(positions.size() << " position records carry no usable exposure field; "
                              << "treating open exposure as zero");
    }

    // Negative exposure is a data artifact, not a short position
    snapshot.open_position_value = std::max(exposure, 0.0);

    DEBUG("Account snapshot: cash=" << snapshot.cash_amount
                                    << " open_position_value=" << snapshot.open_position_value
                                    << " source="
                                    << exposure_source_to_string(snapshot.exposure_source));
    return snapshot;
}

}  // namespace portfolio_recon
