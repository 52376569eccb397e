// include/portfolio_recon/reconcile/record_normalizer.hpp
#pragma once

#include <vector>
#include "portfolio_recon/core/types.hpp"
#include "portfolio_recon/reconcile/reconciliation_config.hpp"

namespace portfolio_recon {

/**
 * @brief Turns raw upstream records into typed fills and settlements
 *
 * Absent or malformed fields degrade per field: fills fall back to zero quantity,
 * zero price and Action::UNKNOWN; settlements keep cash_change and the timestamp
 * as std::nullopt so the ledger can skip or exclude them.
 */
class RecordNormalizer {
public:
    explicit RecordNormalizer(RecordSchema schema);

    Fill to_fill(const Record& record) const;
    Settlement to_settlement(const Record& record) const;

    std::vector<Fill> to_fills(const std::vector<Record>& records) const;
    std::vector<Settlement> to_settlements(const std::vector<Record>& records) const;

    const RecordSchema& schema() const {
        return schema_;
    }

private:
    RecordSchema schema_;
};

}  // namespace portfolio_recon
