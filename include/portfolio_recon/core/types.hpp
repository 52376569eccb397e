// include/portfolio_recon/core/types.hpp

#pragma once

#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace portfolio_recon {

/**
 * @brief Raw activity record as delivered by the upstream API
 * Its shape is owned by the collaborator and varies across API revisions
 */
using Record = nlohmann::json;

/**
 * @brief Epoch milliseconds, UTC
 */
using TimestampMs = int64_t;

/**
 * @brief Money in the engine unit; the record schema converts every field into it
 */
using Money = double;

/**
 * @brief Money in whole cents; every sum is accumulated in this unit
 */
using Cents = int64_t;

inline Cents to_cents(Money amount) {
    return static_cast<Cents>(std::llround(amount * 100.0));
}

inline Money from_cents(Cents cents) {
    return static_cast<Money>(cents) / 100.0;
}

/**
 * @brief Direction of a fill
 */
enum class Action {
    BUY,
    SELL,
    UNKNOWN  // Unrecognized text; counts neither as invested nor as returned
};

inline std::string action_to_string(Action action) {
    switch (action) {
        case Action::BUY:
            return "BUY";
        case Action::SELL:
            return "SELL";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief One executed trade leg
 */
struct Fill {
    std::string contract_id;
    Action action{Action::UNKNOWN};
    int64_t quantity{0};
    Money unit_price{0.0};
    std::optional<TimestampMs> occurred_at_ms;

    Money notional() const {
        return static_cast<double>(quantity) * unit_price;
    }
};

/**
 * @brief The cash effect of one finalized market outcome
 */
struct Settlement {
    std::string contract_id;
    std::optional<Money> cash_change;  // Absent: record is skipped, never zeroed
    std::optional<TimestampMs> occurred_at_ms;
};

/**
 * @brief Which policy produced AccountBalanceSnapshot::open_position_value
 */
enum class ExposureSource {
    SUMMED_EXPOSURE,
    PORTFOLIO_MINUS_CASH,
    NONE
};

inline std::string exposure_source_to_string(ExposureSource source) {
    switch (source) {
        case ExposureSource::SUMMED_EXPOSURE:
            return "SUMMED_EXPOSURE";
        case ExposureSource::PORTFOLIO_MINUS_CASH:
            return "PORTFOLIO_MINUS_CASH";
        default:
            return "NONE";
    }
}

/**
 * @brief Point-in-time balance and exposure reading
 */
struct AccountBalanceSnapshot {
    Money cash_amount{0.0};
    Money open_position_value{0.0};  // Floored at zero
    std::optional<TimestampMs> updated_ts;
    ExposureSource exposure_source{ExposureSource::NONE};

    Money portfolio_total() const {
        return cash_amount + open_position_value;
    }
};

/**
 * @brief One point of the cumulative realized P&L curve
 */
struct CumulativePoint {
    TimestampMs ts_ms{0};
    Money cumulative{0.0};

    bool operator==(const CumulativePoint& other) const {
        return ts_ms == other.ts_ms && cumulative == other.cumulative;
    }
};

using CumulativeSeries = std::vector<CumulativePoint>;

}  // namespace portfolio_recon
