// include/portfolio_recon/data/json_activity_source.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "portfolio_recon/data/activity_source.hpp"

namespace portfolio_recon {

/**
 * @brief Activity source backed by one JSON document
 *
 * Expected shape, every section optional:
 *   {"balance": {...}, "positions": [...], "fills": [...], "settlements": [...]}
 *
 * Window filtering keeps records whose resolved timestamp lies in [since, until]
 * and records without any timestamp; the engine decides what to do with those.
 */
class JsonActivitySource : public IActivitySource {
public:
    /**
     * @param document Parsed activity document
     * @param timestamp_fields Candidate names used for window filtering
     */
    JsonActivitySource(nlohmann::json document, std::vector<std::string> timestamp_fields);

    /**
     * @brief Load the document from a file
     * @return FILE_NOT_FOUND, FILE_IO_ERROR or JSON_PARSE_ERROR on failure
     */
    static Result<std::unique_ptr<JsonActivitySource>> from_file(
        const std::string& path, std::vector<std::string> timestamp_fields);

    Result<std::vector<Record>> fetch_fills(TimestampMs since, TimestampMs until) override;
    Result<std::vector<Record>> fetch_settlements(TimestampMs since, TimestampMs until) override;
    Result<Record> fetch_balance_snapshot() override;
    Result<std::vector<Record>> fetch_positions() override;

private:
    Result<std::vector<Record>> section(const std::string& name) const;
    Result<std::vector<Record>> windowed_section(const std::string& name, TimestampMs since,
                                                 TimestampMs until) const;

    nlohmann::json document_;
    std::vector<std::string> timestamp_fields_;
};

}  // namespace portfolio_recon
