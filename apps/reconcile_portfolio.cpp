// apps/reconcile_portfolio.cpp
// Reconciles a dumped activity document and prints the summary report as JSON

#include <iomanip>
#include <iostream>
#include <string>
#include "portfolio_recon/core/env_loader.hpp"
#include "portfolio_recon/core/logger.hpp"
#include "portfolio_recon/core/time_utils.hpp"
#include "portfolio_recon/data/json_activity_source.hpp"
#include "portfolio_recon/reconcile/reconciliation_config.hpp"
#include "portfolio_recon/reconcile/reconciliation_engine.hpp"

using namespace portfolio_recon;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <activity.json> [--config <file>] [--env <file>] [--include-records]"
              << " [--log-level <LEVEL>]" << std::endl;
    std::cerr << "Example: " << program << " data/activity.json --env .env" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string activity_path;
        std::string config_path;
        std::string env_path;
        std::string log_level = "INFO";
        bool include_records = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--include-records") {
                include_records = true;
            } else if ((arg == "--config" || arg == "--env" || arg == "--log-level") &&
                       i + 1 < argc) {
                std::string value = argv[++i];
                if (arg == "--config")
                    config_path = value;
                else if (arg == "--env")
                    env_path = value;
                else
                    log_level = value;
            } else if (!arg.empty() && arg[0] != '-' && activity_path.empty()) {
                activity_path = arg;
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (activity_path.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        // stdout carries the report, so logs go to files only
        LoggerConfig logger_config;
        logger_config.min_level = level_from_string(log_level, LogLevel::INFO);
        logger_config.destination = LogDestination::FILE;
        logger_config.log_directory = "logs";
        logger_config.filename_prefix = "reconcile_portfolio";
        Logger::instance().initialize(logger_config);
        Logger::register_component("ReconcilePortfolio");

        if (!env_path.empty()) {
            auto env_result = EnvLoader::load(env_path);
            if (env_result.is_error()) {
                std::cerr << "Failed to load env file: " << env_result.error()->what()
                          << std::endl;
                return 1;
            }
        }

        ReconciliationConfig config;
        if (!config_path.empty()) {
            auto load_result = config.load_from_file(config_path);
            if (load_result.is_error()) {
                std::cerr << "Failed to load config: " << load_result.error()->to_string()
                          << std::endl;
                return 1;
            }
        }
        config.apply_env_overrides();
        if (include_records) {
            config.include_raw_records = true;
        }

        auto source_result =
            JsonActivitySource::from_file(activity_path, config.schema.timestamp_fields);
        if (source_result.is_error()) {
            std::cerr << "Failed to load activity: " << source_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        auto source = source_result.take_value();

        const TimestampMs until = core::now_epoch_ms();
        const TimestampMs since =
            until - static_cast<TimestampMs>(config.lookback_days) * 24 * 60 * 60 * 1000;
        INFO("Reconciling " << activity_path << " over the last " << config.lookback_days
                            << " days with total_deposits=" << config.total_deposits);

        ReconciliationEngine engine(config);
        auto report = engine.build_report(*source, since, until, until);
        if (report.is_error()) {
            std::cerr << "Reconciliation failed: " << report.error()->to_string() << std::endl;
            ERROR("Reconciliation failed: " << report.error()->what());
            return 1;
        }

        std::cout << std::setw(4) << report.value().to_json() << std::endl;
        INFO("Summary report written to stdout");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
