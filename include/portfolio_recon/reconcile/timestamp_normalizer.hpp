// include/portfolio_recon/reconcile/timestamp_normalizer.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "portfolio_recon/core/types.hpp"

namespace portfolio_recon {

/**
 * @brief Magnitude above which a numeric timestamp is read as milliseconds
 * At or below it the value is seconds
 */
constexpr int64_t kMillisecondThreshold = 1000000000000LL;

/**
 * @brief Resolves any supported timestamp representation to epoch milliseconds
 *
 * Rules, in order:
 *  - numbers: |v| > 1e12 is milliseconds, otherwise seconds (x1000);
 *    reals are rounded to the nearest millisecond
 *  - strings: ISO-8601, trailing 'Z' or numeric offset; offset-less text is UTC
 *  - anything else is malformed
 *
 * Malformed values are reported as std::nullopt, never as "now" or zero.
 */
class TimestampNormalizer {
public:
    static std::optional<TimestampMs> normalize(const nlohmann::json& value);

    /**
     * @brief Normalize a numeric value using the seconds/milliseconds threshold
     */
    static std::optional<TimestampMs> from_number(double value);
    static std::optional<TimestampMs> from_integer(int64_t value);

    /**
     * @brief Parse ISO-8601 text
     *
     * Accepts YYYY-MM-DD, optionally followed by 'T' (or a space) and HH:MM[:SS[.fff]],
     * then an optional 'Z', +HH:MM, +HHMM or +HH offset.
     */
    static std::optional<TimestampMs> parse_iso8601(const std::string& text);

    /**
     * @brief First candidate field that normalizes successfully
     *
     * A malformed value falls through to the next candidate name.
     */
    static std::optional<TimestampMs> resolve(const Record& record,
                                              const std::vector<std::string>& candidates);
};

}  // namespace portfolio_recon
