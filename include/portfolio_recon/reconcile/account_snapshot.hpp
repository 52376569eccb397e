// include/portfolio_recon/reconcile/account_snapshot.hpp
#pragma once

#include <vector>
#include "portfolio_recon/core/types.hpp"
#include "portfolio_recon/reconcile/reconciliation_config.hpp"

namespace portfolio_recon {

/**
 * @brief Builds the point-in-time balance/exposure reading
 *
 * Open exposure is the sum of per-position exposure (primary policy). Only when no
 * position records were supplied and the balance record reports a portfolio value is
 * the portfolio-minus-cash arithmetic used instead; that fallback is logged at
 * WARNING. The exposure is floored at zero under every policy.
 */
class AccountSnapshotBuilder {
public:
    explicit AccountSnapshotBuilder(const ReconciliationConfig& config);

    /**
     * @brief Build a snapshot from the balance record and open position records
     * @param balance Raw balance record
     * @param positions Raw unsettled position records, possibly empty
     */
    AccountBalanceSnapshot build(const Record& balance, const std::vector<Record>& positions) const;

    /**
     * @brief Sum of per-position exposure, each rounded to whole cents
     * @return std::nullopt when no record carried a usable exposure field
     */
    std::optional<Money> summed_exposure(const std::vector<Record>& positions) const;

private:
    RecordSchema schema_;
    bool allow_balance_fallback_;
};

}  // namespace portfolio_recon
