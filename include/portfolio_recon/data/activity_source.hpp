// include/portfolio_recon/data/activity_source.hpp
#pragma once

#include <vector>
#include "portfolio_recon/core/error.hpp"
#include "portfolio_recon/core/types.hpp"

namespace portfolio_recon {

/**
 * @brief Supplier of raw account activity
 *
 * Implementations own authentication, pagination and retries. Record shapes are
 * theirs; the engine only reads them through the record schema.
 */
class IActivitySource {
public:
    virtual ~IActivitySource() = default;

    /**
     * @brief Fills executed in [since, until]
     * @param since Window start, epoch milliseconds
     * @param until Window end, epoch milliseconds
     */
    virtual Result<std::vector<Record>> fetch_fills(TimestampMs since, TimestampMs until) = 0;

    /**
     * @brief Settlements applied in [since, until]
     */
    virtual Result<std::vector<Record>> fetch_settlements(TimestampMs since,
                                                          TimestampMs until) = 0;

    /**
     * @brief Current cash balance record
     */
    virtual Result<Record> fetch_balance_snapshot() = 0;

    /**
     * @brief Unsettled positions; an empty list is valid
     */
    virtual Result<std::vector<Record>> fetch_positions() = 0;
};

}  // namespace portfolio_recon
