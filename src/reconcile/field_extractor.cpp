// src/reconcile/field_extractor.cpp

#include "portfolio_recon/reconcile/field_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace portfolio_recon {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<double> parse_decimal(const std::string& raw) {
    std::string text = trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<nlohmann::json> FieldExtractor::first_present(
    const Record& record, const std::vector<std::string>& candidates) {
    return first_match<nlohmann::json>(
        record, candidates,
        [](const nlohmann::json& value) { return std::make_optional<nlohmann::json>(value); });
}

std::optional<std::string> FieldExtractor::extract_text(
    const Record& record, const std::vector<std::string>& candidates) {
    return first_match<std::string>(
        record, candidates, [](const nlohmann::json& value) -> std::optional<std::string> {
            if (!value.is_string()) {
                return std::nullopt;
            }
            return value.get<std::string>();
        });
}

std::optional<Money> FieldExtractor::extract_money(const Record& record,
                                                   const std::vector<MoneyField>& candidates) {
    if (!record.is_object()) {
        return std::nullopt;
    }

    for (const auto& field : candidates) {
        auto it = record.find(field.name);
        if (it == record.end() || it->is_null()) {
            continue;
        }
        std::optional<double> amount = to_number(*it);
        if (!amount) {
            continue;
        }
        double scaled = *amount * field.scale;
        if (!std::isfinite(scaled)) {
            continue;
        }
        return scaled;
    }
    return std::nullopt;
}

std::optional<int64_t> FieldExtractor::extract_quantity(
    const Record& record, const std::vector<std::string>& candidates) {
    return first_match<int64_t>(
        record, candidates, [](const nlohmann::json& value) -> std::optional<int64_t> {
            if (value.is_number_unsigned()) {
                uint64_t count = value.get<uint64_t>();
                if (count > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return std::nullopt;
                }
                return static_cast<int64_t>(count);
            }
            if (value.is_number_integer()) {
                int64_t count = value.get<int64_t>();
                if (count < 0) {
                    return std::nullopt;
                }
                return count;
            }

            std::optional<double> number = to_number(value);
            if (!number || *number < 0.0 || *number >= 9.0e18 ||
                std::floor(*number) != *number) {
                return std::nullopt;
            }
            return static_cast<int64_t>(*number);
        });
}

std::optional<double> FieldExtractor::to_number(const nlohmann::json& value) {
    if (value.is_number()) {
        double number = value.get<double>();
        if (!std::isfinite(number)) {
            return std::nullopt;
        }
        return number;
    }
    if (value.is_string()) {
        return parse_decimal(value.get<std::string>());
    }
    return std::nullopt;
}

Action FieldExtractor::parse_action(const std::string& text) {
    std::string lowered = trim(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "buy") {
        return Action::BUY;
    }
    if (lowered == "sell") {
        return Action::SELL;
    }
    return Action::UNKNOWN;
}

}  // namespace portfolio_recon
