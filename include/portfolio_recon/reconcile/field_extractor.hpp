// include/portfolio_recon/reconcile/field_extractor.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "portfolio_recon/core/types.hpp"

namespace portfolio_recon {

/**
 * @brief A candidate money field and the factor converting it into the engine unit
 */
struct MoneyField {
    std::string name;
    double scale{1.0};
};

/**
 * @brief Pulls one logical value out of a record that may carry it under several names
 *
 * Every lookup walks an ordered candidate list and returns the first usable value.
 * A value that is present but malformed counts as absent and the next candidate is
 * tried. Nothing here throws for any JSON input.
 */
class FieldExtractor {
public:
    /**
     * @brief First present, non-null value among the candidates
     * @param record Raw record; anything other than an object yields std::nullopt
     * @param candidates Field names in priority order
     */
    static std::optional<nlohmann::json> first_present(const Record& record,
                                                       const std::vector<std::string>& candidates);

    /**
     * @brief First candidate whose value the converter accepts
     * @param convert Callable json -> std::optional<T>; std::nullopt rejects the value
     */
    template <typename T, typename Convert>
    static std::optional<T> first_match(const Record& record,
                                        const std::vector<std::string>& candidates,
                                        Convert convert) {
        if (!record.is_object()) {
            return std::nullopt;
        }
        for (const auto& name : candidates) {
            auto it = record.find(name);
            if (it == record.end() || it->is_null()) {
                continue;
            }
            std::optional<T> converted = convert(*it);
            if (converted) {
                return converted;
            }
        }
        return std::nullopt;
    }

    static std::optional<std::string> extract_text(const Record& record,
                                                   const std::vector<std::string>& candidates);

    /**
     * @brief Money amount converted to the engine unit
     *
     * Accepts JSON numbers and numeric strings such as "12.34"; non-finite values are
     * rejected. The winning candidate's scale is applied.
     */
    static std::optional<Money> extract_money(const Record& record,
                                              const std::vector<MoneyField>& candidates);

    /**
     * @brief Non-negative integral count (numbers or integral numeric strings)
     */
    static std::optional<int64_t> extract_quantity(const Record& record,
                                                   const std::vector<std::string>& candidates);

    /**
     * @brief Numeric view of a JSON value, accepting numeric strings
     * @return std::nullopt for non-numeric or non-finite values
     */
    static std::optional<double> to_number(const nlohmann::json& value);

    /**
     * @brief Case-insensitive "buy"/"sell"; anything else is Action::UNKNOWN
     */
    static Action parse_action(const std::string& text);
};

}  // namespace portfolio_recon
