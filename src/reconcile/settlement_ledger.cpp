// src/reconcile/settlement_ledger.cpp

#include "portfolio_recon/reconcile/settlement_ledger.hpp"
#include <algorithm>
#include "portfolio_recon/core/logger.hpp"

namespace portfolio_recon {

std::vector<Settlement> SettlementLedger::sort_by_time(
    const std::vector<Settlement>& settlements) {
    std::vector<Settlement> sorted(settlements);
    std::stable_sort(sorted.begin(), sorted.end(), [](const Settlement& a, const Settlement& b) {
        if (!a.occurred_at_ms || !b.occurred_at_ms) {
            return a.occurred_at_ms.has_value() && !b.occurred_at_ms.has_value();
        }
        return *a.occurred_at_ms < *b.occurred_at_ms;
    });
    return sorted;
}

LedgerSummary SettlementLedger::reconcile(const std::vector<Settlement>& settlements,
                                          Money total_invested) const {
    LedgerSummary summary;
    summary.cumulative_series.reserve(settlements.size());
    Cents realized = 0;
    Cents cash_in = 0;
    Cents cash_out = 0;

    for (const auto& settlement : sort_by_time(settlements)) {
        if (!settlement.cash_change) {
            ++summary.skipped_count;
            continue;
        }

        const Cents cash_change = to_cents(*settlement.cash_change);
        realized += cash_change;
        if (cash_change > 0) {
            cash_in += cash_change;
        } else if (cash_change < 0) {
            cash_out -= cash_change;
        }
        ++summary.settled_count;

        if (settlement.occurred_at_ms) {
            summary.cumulative_series.push_back(
                {*settlement.occurred_at_ms, from_cents(realized)});
        } else {
            ++summary.untimestamped_count;
        }
    }

    summary.realized_pnl = from_cents(realized);
    summary.cash_in = from_cents(cash_in);
    summary.cash_out = from_cents(cash_out);
    summary.return_rate = calculate_return_rate(summary.realized_pnl, total_invested);

    DEBUG("Ledger settled " << summary.settled_count << " of " << settlements.size()
                            << " settlements (" << summary.skipped_count
                            << " without cash change, " << summary.untimestamped_count
                            << " without timestamp); realized_pnl=" << summary.realized_pnl);
    return summary;
}

Money SettlementLedger::calculate_return_rate(Money realized_pnl, Money total_invested) {
    if (total_invested <= 0.0) {
        return 0.0;
    }
    return realized_pnl / total_invested;
}

}  // namespace portfolio_recon
