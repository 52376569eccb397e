// src/reconcile/reconciliation_engine.cpp

#include "portfolio_recon/reconcile/reconciliation_engine.hpp"
#include "portfolio_recon/core/logger.hpp"
#include "portfolio_recon/core/time_utils.hpp"

namespace portfolio_recon {

namespace {

template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace

ReconciliationEngine::ReconciliationEngine(ReconciliationConfig config)
    : config_(std::move(config)),
      normalizer_(config_.schema),
      snapshot_builder_(config_) {}

Result<PortfolioSummary> ReconciliationEngine::reconcile(
    const std::vector<Record>& fills, const std::vector<Record>& settlements,
    const Record& balance, const std::vector<Record>& positions) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        ERROR("Refusing to reconcile: " << valid.error()->what());
        return forward_error<PortfolioSummary>(valid);
    }

    const CashFlowSummary cash_flow = cash_flow_aggregator_.aggregate(normalizer_.to_fills(fills));
    const LedgerSummary ledger = settlement_ledger_.reconcile(
        normalizer_.to_settlements(settlements), cash_flow.total_invested);
    const AccountBalanceSnapshot snapshot = snapshot_builder_.build(balance, positions);

    PortfolioSummary summary = composer_.compose(snapshot, cash_flow, ledger,
                                                 config_.total_deposits);

    INFO("Reconciled " << fills.size() << " fills and " << settlements.size()
                       << " settlements: realized_pnl=" << summary.realized_pnl
                       << " net_profit=" << summary.net_profit);
    return summary;
}

Result<ReconciliationEngine::ActivityBatch> ReconciliationEngine::fetch(
    IActivitySource& source, TimestampMs since, TimestampMs until) const {
    if (since > until) {
        return make_error<ActivityBatch>(ErrorCode::INVALID_ARGUMENT,
                                         "Activity window starts after it ends",
                                         "ReconciliationEngine");
    }

    auto balance = source.fetch_balance_snapshot();
    if (balance.is_error()) {
        return forward_error<ActivityBatch>(balance);
    }
    auto positions = source.fetch_positions();
    if (positions.is_error()) {
        return forward_error<ActivityBatch>(positions);
    }
    auto fills = source.fetch_fills(since, until);
    if (fills.is_error()) {
        return forward_error<ActivityBatch>(fills);
    }
    auto settlements = source.fetch_settlements(since, until);
    if (settlements.is_error()) {
        return forward_error<ActivityBatch>(settlements);
    }

    DEBUG("Fetched window [" << core::format_iso8601_utc(since) << ", "
                             << core::format_iso8601_utc(until) << "]: " << fills.value().size()
                             << " fills, " << settlements.value().size() << " settlements, "
                             << positions.value().size() << " positions");

    ActivityBatch batch;
    batch.fills = fills.take_value();
    batch.settlements = settlements.take_value();
    batch.balance = balance.take_value();
    batch.positions = positions.take_value();
    return batch;
}

Result<PortfolioSummary> ReconciliationEngine::reconcile(IActivitySource& source,
                                                         TimestampMs since,
                                                         TimestampMs until) const {
    auto batch = fetch(source, since, until);
    if (batch.is_error()) {
        return forward_error<PortfolioSummary>(batch);
    }
    const ActivityBatch& inputs = batch.value();
    return reconcile(inputs.fills, inputs.settlements, inputs.balance, inputs.positions);
}

Result<SummaryReport> ReconciliationEngine::build_report(IActivitySource& source,
                                                         TimestampMs since, TimestampMs until,
                                                         TimestampMs generated_at_ms) const {
    auto batch = fetch(source, since, until);
    if (batch.is_error()) {
        return forward_error<SummaryReport>(batch);
    }
    const ActivityBatch& inputs = batch.value();

    auto summary = reconcile(inputs.fills, inputs.settlements, inputs.balance, inputs.positions);
    if (summary.is_error()) {
        return forward_error<SummaryReport>(summary);
    }
    return make_report(summary.take_value(), generated_at_ms, inputs.fills, inputs.settlements);
}

SummaryReport ReconciliationEngine::make_report(PortfolioSummary summary,
                                                TimestampMs generated_at_ms,
                                                const std::vector<Record>& fills,
                                                const std::vector<Record>& settlements) const {
    SummaryReport report;
    report.summary = std::move(summary);
    report.generated_at = core::format_iso8601_utc(generated_at_ms);
    report.lookback_days = config_.lookback_days;
    if (config_.include_raw_records) {
        report.fills = fills;
        report.settlements = settlements;
    }
    return report;
}

}  // namespace portfolio_recon
