// src/data/json_activity_source.cpp

#include "portfolio_recon/data/json_activity_source.hpp"
#include <filesystem>
#include <fstream>
#include "portfolio_recon/core/logger.hpp"
#include "portfolio_recon/reconcile/timestamp_normalizer.hpp"

namespace portfolio_recon {

JsonActivitySource::JsonActivitySource(nlohmann::json document,
                                       std::vector<std::string> timestamp_fields)
    : document_(std::move(document)), timestamp_fields_(std::move(timestamp_fields)) {}

Result<std::unique_ptr<JsonActivitySource>> JsonActivitySource::from_file(
    const std::string& path, std::vector<std::string> timestamp_fields) {
    if (!std::filesystem::exists(path)) {
        return make_error<std::unique_ptr<JsonActivitySource>>(
            ErrorCode::FILE_NOT_FOUND, "Activity file not found: " + path, "JsonActivitySource");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::unique_ptr<JsonActivitySource>>(
            ErrorCode::FILE_IO_ERROR, "Failed to open activity file: " + path,
            "JsonActivitySource");
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<std::unique_ptr<JsonActivitySource>>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse activity file " + path + ": " + e.what(), "JsonActivitySource");
    }

    if (!document.is_object()) {
        return make_error<std::unique_ptr<JsonActivitySource>>(
            ErrorCode::INVALID_DATA, "Activity document must be a JSON object: " + path,
            "JsonActivitySource");
    }

    INFO("Loaded activity document from " << path);
    return std::make_unique<JsonActivitySource>(std::move(document),
                                                std::move(timestamp_fields));
}

Result<std::vector<Record>> JsonActivitySource::section(const std::string& name) const {
    if (!document_.is_object() || !document_.contains(name) || document_.at(name).is_null()) {
        return std::vector<Record>{};
    }

    const auto& value = document_.at(name);
    if (!value.is_array()) {
        return make_error<std::vector<Record>>(ErrorCode::INVALID_DATA,
                                               "Section '" + name + "' must be a JSON array",
                                               "JsonActivitySource");
    }
    return value.get<std::vector<Record>>();
}

Result<std::vector<Record>> JsonActivitySource::windowed_section(const std::string& name,
                                                                 TimestampMs since,
                                                                 TimestampMs until) const {
    auto all = section(name);
    if (all.is_error()) {
        return make_error<std::vector<Record>>(all.error()->code(), all.error()->what(),
                                               "JsonActivitySource");
    }

    std::vector<Record> in_window;
    size_t dropped = 0;
    for (const auto& record : all.value()) {
        auto ts = TimestampNormalizer::resolve(record, timestamp_fields_);
        if (ts && (*ts < since || *ts > until)) {
            ++dropped;
            continue;
        }
        in_window.push_back(record);
    }

    DEBUG("Section '" << name << "': kept " << in_window.size() << ", dropped " << dropped
                      << " outside window");
    return in_window;
}

Result<std::vector<Record>> JsonActivitySource::fetch_fills(TimestampMs since,
                                                            TimestampMs until) {
    return windowed_section("fills", since, until);
}

Result<std::vector<Record>> JsonActivitySource::fetch_settlements(TimestampMs since,
                                                                  TimestampMs until) {
    return windowed_section("settlements", since, until);
}

Result<Record> JsonActivitySource::fetch_balance_snapshot() {
    if (!document_.is_object() || !document_.contains("balance") ||
        document_.at("balance").is_null()) {
        return Record::object();
    }

    const auto& balance = document_.at("balance");
    if (!balance.is_object()) {
        return make_error<Record>(ErrorCode::INVALID_DATA,
                                  "Section 'balance' must be a JSON object",
                                  "JsonActivitySource");
    }
    return Record(balance);
}

Result<std::vector<Record>> JsonActivitySource::fetch_positions() {
    return section("positions");
}

}  // namespace portfolio_recon
