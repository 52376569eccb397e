// include/portfolio_recon/reconcile/reconciliation_engine.hpp
#pragma once

#include <vector>
#include "portfolio_recon/core/error.hpp"
#include "portfolio_recon/core/types.hpp"
#include "portfolio_recon/data/activity_source.hpp"
#include "portfolio_recon/reconcile/account_snapshot.hpp"
#include "portfolio_recon/reconcile/account_snapshot_composer.hpp"
#include "portfolio_recon/reconcile/cash_flow_aggregator.hpp"
#include "portfolio_recon/reconcile/portfolio_summary.hpp"
#include "portfolio_recon/reconcile/reconciliation_config.hpp"
#include "portfolio_recon/reconcile/record_normalizer.hpp"
#include "portfolio_recon/reconcile/settlement_ledger.hpp"

namespace portfolio_recon {

/**
 * @brief Stateless transform from raw account activity to a PortfolioSummary
 *
 * Pipeline: RecordNormalizer -> CashFlowAggregator / SettlementLedger ->
 * AccountSnapshotBuilder -> AccountSnapshotComposer. Two runs over the same records,
 * in any order, produce the same summary.
 */
class ReconciliationEngine {
public:
    explicit ReconciliationEngine(ReconciliationConfig config);

    /**
     * @brief Reconcile already-fetched records
     * @param fills Raw fill records
     * @param settlements Raw settlement records
     * @param balance Raw balance record
     * @param positions Raw unsettled position records
     * @return Summary, or INVALID_CONFIG if the configuration is unusable
     */
    Result<PortfolioSummary> reconcile(const std::vector<Record>& fills,
                                       const std::vector<Record>& settlements,
                                       const Record& balance,
                                       const std::vector<Record>& positions) const;

    /**
     * @brief Pull the inputs from a collaborator and reconcile them
     *
     * Errors reported by the source are returned unchanged.
     */
    Result<PortfolioSummary> reconcile(IActivitySource& source, TimestampMs since,
                                       TimestampMs until) const;

    /**
     * @brief Fetch, reconcile and wrap the result in the interchange envelope
     * @param generated_at_ms Report time, epoch milliseconds
     */
    Result<SummaryReport> build_report(IActivitySource& source, TimestampMs since,
                                       TimestampMs until, TimestampMs generated_at_ms) const;

    /**
     * @brief Wrap a summary in the interchange envelope
     *
     * Raw records are echoed only when include_raw_records is set.
     */
    SummaryReport make_report(PortfolioSummary summary, TimestampMs generated_at_ms,
                              const std::vector<Record>& fills,
                              const std::vector<Record>& settlements) const;

    const ReconciliationConfig& config() const {
        return config_;
    }

private:
    struct ActivityBatch {
        std::vector<Record> fills;
        std::vector<Record> settlements;
        Record balance;
        std::vector<Record> positions;
    };

    Result<ActivityBatch> fetch(IActivitySource& source, TimestampMs since,
                                TimestampMs until) const;

    ReconciliationConfig config_;
    RecordNormalizer normalizer_;
    CashFlowAggregator cash_flow_aggregator_;
    SettlementLedger settlement_ledger_;
    AccountSnapshotBuilder snapshot_builder_;
    AccountSnapshotComposer composer_;
};

}  // namespace portfolio_recon
